// Copyright 2025 Tenstorrent Corporation or its affiliates.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstdint>
#include "GasidAllocator.hpp"
#include "Timer.hpp"
#include "VcpuContext.hpp"

namespace ArmHyp
{

  class Stage2Context;

  /// Virtual CPU of a guest: register context and virtual timer bound
  /// to the guest's address-space id and translation root.
  class Vcpu
  {
  public:

    /// Define a VCPU of the guest owning the given stage-2 context.
    Vcpu(unsigned id, const Stage2Context& stage2, const PlatformInfo& platform = PlatformInfo{});

    /// Fix the virtual timer offset to the current physical counter and
    /// load the hypervisor sub-record from the core's configuration:
    /// stage-2 routing, the guest's translation root, FP trapped and a
    /// guest affinity derived from the id.
    HvError init(SysRegAccess& regs);

    unsigned id() const
    { return context_.id(); }

    Gasid gasid() const
    { return gasid_; }

    VcpuContext& context()
    { return context_; }

    const VcpuContext& context() const
    { return context_; }

    VirtualTimer& timer()
    { return timer_; }

    const VirtualTimer& timer() const
    { return timer_; }

    /// Return true if init succeeded: the timer offset is fixed and the
    /// hypervisor sub-record is loaded.
    bool isInitialized() const
    { return initialized_; }

    /// Return true if this VCPU is running on some core.
    bool isRunning() const
    { return running_; }

    void setRunning(bool flag)
    { running_ = flag; }

    /// Put the register context and the timer in their reset state.
    /// The timer offset and the hypervisor sub-record are kept.
    void reset();

  private:

    Gasid gasid_ = 0;
    uint64_t vttbr_ = 0;
    VcpuContext context_;
    VirtualTimer timer_;
    bool running_ = false;
    bool initialized_ = false;
  };

}
