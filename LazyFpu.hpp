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
#include "FpRegs.hpp"
#include "SysRegAccess.hpp"
#include "VcpuContext.hpp"

namespace ArmHyp
{

  /// Owner of the live SIMD/FP register file of a physical core.
  struct FpuOwner
  {
    enum class Kind : uint32_t { None, Host, Vcpu };

    Kind kind = Kind::Host;
    unsigned vcpuId = 0;   // Valid when kind is Vcpu

    bool operator==(const FpuOwner& other) const = default;
  };


  /// Lazy SIMD/FP switching for one physical core. A guest entered on a
  /// core whose live FP file belongs to someone else runs with FP
  /// accesses trapped (CPTR_EL2.TFP set). The first access traps to
  /// handleTrap which moves the register file and clears the trap. A
  /// guest that touches no FP register never pays for the move.
  ///
  /// The owner is tracked by the address of its register storage: a
  /// VcpuContext owning the file must be released before it is
  /// destroyed.
  class LazyFpu
  {
  public:

    /// The host owns the live file at construction.
    explicit LazyFpu(SysRegAccess& regs)
      : regs_(regs), ownerRegs_(&hostFp_)
    { }

    LazyFpu(const LazyFpu&) = delete;
    LazyFpu& operator=(const LazyFpu&) = delete;

    const FpuOwner& owner() const
    { return owner_; }

    /// Return true if the live file belongs to the given VCPU.
    bool owns(const VcpuContext& vcpu) const
    { return ownerRegs_ == &vcpu.fpRegs(); }

    /// Program the FP trap for an entry into the given VCPU: clear if it
    /// owns the live file, set otherwise. The VCPU's saved CPTR_EL2 is
    /// updated to match.
    HvError trapOnEntry(VcpuContext& vcpu);

    /// Handle an FP access trap (exception class 0x07) taken from the
    /// given VCPU: save the file of the previous owner, load the VCPU's
    /// file and clear the trap. Return InvalidArgument if esr is not an
    /// FP access trap.
    HvError handleTrap(uint64_t esr, VcpuContext& vcpu);

    /// Give the live file back to the hypervisor.
    HvError claimForHost();

    /// If the given VCPU owns the live file, save it into the VCPU's
    /// context and leave the file ownerless.
    HvError release(VcpuContext& vcpu);

    /// Saved hypervisor FP state (valid while the host does not own the
    /// live file).
    const FpRegs& hostFp() const
    { return hostFp_; }

    /// Return the number of register file moves performed.
    uint64_t switchCount() const
    { return switches_; }

  private:

    /// Set or clear CPTR_EL2.TFP in the hardware.
    HvError setTrap(bool trap);

    /// Copy the live file into fp.
    HvError saveFp(FpRegs& fp);

    /// Copy fp into the live file.
    HvError loadFp(const FpRegs& fp);

    /// Move the live file to the storage of the current owner (if any)
    /// and load the given one.
    HvError switchTo(FpRegs& fp, const FpuOwner& owner);

    SysRegAccess& regs_;
    FpuOwner owner_;
    FpRegs hostFp_;
    FpRegs* ownerRegs_ = nullptr;
    uint64_t switches_ = 0;
  };

}
