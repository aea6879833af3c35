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
#include <memory>
#include <vector>
#include "Args.hpp"
#include "Collaborators.hpp"
#include "GasidAllocator.hpp"
#include "HvConfig.hpp"
#include "PageTableArena.hpp"
#include "SimCpu.hpp"
#include "SysRegAccess.hpp"
#include "Tlb.hpp"
#include "Vcpu.hpp"
#include "VmManager.hpp"
#include "WorldSwitch.hpp"


namespace ArmHyp
{

  /// Manage an armhyp session: a simulated system of cores sharing a
  /// TLB, the guests of the configuration and their virtual CPUs.
  class Session
  {
  public:

    Session();

    ~Session();

    /// Create the cores, the table pool, the id allocator and the VM
    /// manager from the configuration and the command line overrides.
    /// Return false on failure.
    bool defineSystem(const Args& args, const HvConfig& config);

    /// Enter hypervisor mode on every core, create the configured
    /// guests, map their memory and create their virtual CPUs. Return
    /// false on failure.
    bool configureSystem(const Args& args);

    /// Switch every virtual CPU in and out once on its core, resolve the
    /// first touch of each lazy region, translate the requested
    /// addresses and print the requested dumps. Return false on failure.
    bool run(const Args& args);

    /// Print the translation of each of the given guest-physical
    /// addresses in every guest. Successful translations are cached in
    /// the TLB. Return true if every address translated.
    bool translateAddresses(const std::vector<uint64_t>& addrs, std::ostream& out);

    const HvParams& params() const
    { return params_; }

    unsigned coreCount() const
    { return unsigned(cores_.size()); }

    SimCpu& core(unsigned ix)
    { return *cores_.at(ix); }

    WorldSwitch& worldSwitch(unsigned ix)
    { return *switches_.at(ix); }

    VmManager& vmManager()
    { return *vms_; }

    const std::vector<Gasid>& guestIds() const
    { return guestIds_; }

    const std::vector<std::unique_ptr<Vcpu>>& vcpus() const
    { return vcpus_; }

    /// Return the number of virtual interrupts injected so far.
    uint64_t injectedCount() const;

    /// Return the number of slice expiries reported so far.
    uint64_t sliceExpiryCount() const;

  private:

    class ConsoleGic;
    class ConsoleScheduler;

    /// Run one slice of the given VCPU on the given core.
    bool runSlice(unsigned coreIx, Vcpu& vcpu, bool trace);

    /// Raise a translation fault in the first page of every lazy region
    /// of the given VCPU's guest and let the core resolve it.
    bool touchLazyRegions(unsigned coreIx, Vcpu& vcpu);

    HvParams params_;
    std::shared_ptr<Tlb> tlb_;
    std::vector<std::unique_ptr<SimCpu>> cores_;
    std::vector<std::unique_ptr<SysRegAccess>> regs_;
    std::unique_ptr<GasidAllocator> gasids_;
    std::unique_ptr<PageTableArena> arena_;
    std::unique_ptr<VmManager> vms_;
    std::unique_ptr<ConsoleGic> gic_;
    std::unique_ptr<ConsoleScheduler> scheduler_;
    std::vector<std::unique_ptr<WorldSwitch>> switches_;
    std::vector<std::unique_ptr<Vcpu>> vcpus_;
    std::vector<Gasid> guestIds_;
  };

}
