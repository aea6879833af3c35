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
#include <iosfwd>
#include "Collaborators.hpp"
#include "LazyFpu.hpp"
#include "Stage2Fault.hpp"
#include "SysRegAccess.hpp"
#include "Timer.hpp"
#include "Vcpu.hpp"
#include "VcpuContext.hpp"

namespace ArmHyp
{

  class VmManager;


  /// Transitions of one physical core between the hypervisor and the
  /// guest VCPUs scheduled on it. Each transition runs with interrupts
  /// masked as a single block: host registers, guest registers, the
  /// stage-2 root, the FP trap and the virtual timer move together.
  class WorldSwitch
  {
  public:

    WorldSwitch(SysRegAccess& regs, VmManager& vms, InterruptController& gic,
                SchedulerHooks& scheduler, const PlatformInfo& platform = PlatformInfo{});

    WorldSwitch(const WorldSwitch&) = delete;
    WorldSwitch& operator=(const WorldSwitch&) = delete;

    /// Save the hypervisor state of the core and load the given VCPU:
    /// registers, translation root and routing, FP trap and virtual
    /// timer. Return InvalidArgument if a VCPU is already loaded on this
    /// core, the given VCPU runs elsewhere or was never initialized, and
    /// TimerNotInitialized if its timer has no offset. On failure the
    /// core is left in hypervisor context.
    HvError restoreAll(Vcpu& vcpu);

    /// Capture the state of the given VCPU, which must be the one loaded
    /// on this core, and reload the hypervisor state. The hypervisor
    /// state is reloaded even if capturing the guest state fails.
    HvError saveAll(Vcpu& vcpu);

    /// Handle a timer interrupt taken on this core. The hypervisor timer
    /// reports slice expiry to the scheduler; the line backing the
    /// virtual timer of the loaded VCPU injects the guest timer
    /// interrupt when due. Event tells what happened. Return
    /// InvalidArgument if irq is not a timer line of this core.
    HvError dispatchIrq(unsigned irq, TimerEvent& event);

    /// Handle a synchronous trap taken from the loaded VCPU using the
    /// syndrome registers of the core. FP access traps switch the FP
    /// file; stage-2 aborts are resolved through the VM manager. An
    /// abort that can't be resolved fills error and returns its fault
    /// code. Return InvalidArgument for other exception classes.
    HvError handleTrap(Vcpu& vcpu, GuestMemoryError& error);

    /// Arm the hypervisor timer to end the current slice after the
    /// given number of microseconds.
    HvError armSlice(uint64_t us);

    /// Write back the FP file of the given VCPU if it is live on this
    /// core. Must be called before the VCPU is destroyed.
    HvError releaseVcpu(Vcpu& vcpu);

    /// Return the VCPU loaded on this core or nullptr.
    Vcpu* current() const
    { return current_; }

    LazyFpu& lazyFpu()
    { return lazyFpu_; }

    HypervisorTimer& hypTimer()
    { return hypTimer_; }

    const HostContext& hostContext() const
    { return host_; }

    /// Print a line per injected interrupt and slice expiry to the
    /// given stream (default std::cerr).
    void enableTrace(bool flag, std::ostream* out = nullptr);

  private:

    SysRegAccess& regs_;
    VmManager& vms_;
    InterruptController& gic_;
    SchedulerHooks& scheduler_;
    uint64_t frequency_ = defaultCounterFrequency;

    HostContext host_;
    LazyFpu lazyFpu_;
    HypervisorTimer hypTimer_;
    Vcpu* current_ = nullptr;
    std::ostream* trace_ = nullptr;
  };

}
