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

#include <array>
#include <cstdint>
#include <iosfwd>
#include "FpRegs.hpp"
#include "IntRegs.hpp"
#include "SysRegAccess.hpp"
#include "SysRegs.hpp"

namespace ArmHyp
{

  /// Hypervisor-owned registers that are loaded on each entry into a
  /// guest.
  struct HypRegs
  {
    uint64_t hcr = 0;
    uint64_t vttbr = 0;
    uint64_t cptr = 0;
    uint64_t vmpidr = 0;
    uint64_t vpidr = 0;

    bool operator==(const HypRegs& other) const = default;
  };


  /// Hypervisor state of a physical core saved while a guest runs on it.
  struct HostContext
  {
    uint64_t hcr = 0;
    uint64_t vttbr = 0;
    uint64_t cptr = 0;
    uint64_t tpidr = 0;
    uint64_t mdcr = 0;
    uint64_t hstr = 0;

    bool operator==(const HostContext& other) const = default;
  };


  /// Architectural state of one virtual CPU while it is not running:
  /// general purpose registers, the exception return state, the guest
  /// EL1/EL0 system registers, the SIMD/FP file and the hypervisor
  /// sub-record. The SIMD/FP file is not moved by saveGuest and
  /// restoreGuest: it follows the lazy switching protocol.
  class VcpuContext
  {
  public:

    /// Process state at reset: EL1h with D, A, I and F masked.
    static constexpr uint64_t resetPstate = 0x3c5;

    /// SCTLR_EL1 at reset: reserved-one bits only, MMU off.
    static constexpr uint64_t resetSctlrEl1 = 0x30d00800;

    explicit VcpuContext(unsigned id = 0);

    unsigned id() const
    { return id_; }

    IntRegs& intRegs()
    { return intRegs_; }

    const IntRegs& intRegs() const
    { return intRegs_; }

    FpRegs& fpRegs()
    { return fpRegs_; }

    const FpRegs& fpRegs() const
    { return fpRegs_; }

    /// Address the guest resumes at (ELR_EL2 on entry).
    uint64_t pc() const
    { return pc_; }

    void setPc(uint64_t pc)
    { pc_ = pc; }

    /// Process state the guest resumes with (SPSR_EL2 on entry).
    uint64_t pstate() const
    { return pstate_; }

    void setPstate(uint64_t value)
    { pstate_ = value; }

    /// Guest kernel stack pointer.
    uint64_t sp() const
    { return el1Regs_.at(indexOfSp_); }

    void setSp(uint64_t value)
    { el1Regs_.at(indexOfSp_) = value; }

    /// Set value to the saved copy of the given guest register. Return
    /// false if reg is not part of the guest state.
    bool sysReg(SysReg reg, uint64_t& value) const;

    /// Set the saved copy of the given guest register. Return false if
    /// reg is not part of the guest state.
    bool setSysReg(SysReg reg, uint64_t value);

    HypRegs& hyp()
    { return hyp_; }

    const HypRegs& hyp() const
    { return hyp_; }

    /// Put the guest state in its reset configuration. The hypervisor
    /// sub-record is kept.
    void reset();

    /// Capture the guest state from the core. Interrupts must be
    /// masked.
    HvError saveGuest(SysRegAccess& regs);

    /// Load the guest state into the core. Interrupts must be masked.
    HvError restoreGuest(SysRegAccess& regs) const;

    /// Print the saved general purpose registers, the resume state and
    /// the guest system registers, one per line. Use the alternate
    /// register names (fp, lr, ...) if abiNames is true.
    void print(std::ostream& out, bool abiNames = false) const;

    bool operator==(const VcpuContext& other) const = default;

  private:

    /// Set ix to the position of reg in guestSysRegs.
    static bool guestRegIndex(SysReg reg, unsigned& ix);

    static unsigned spIndex();

    unsigned id_ = 0;
    IntRegs intRegs_;
    uint64_t pc_ = 0;
    uint64_t pstate_ = resetPstate;
    std::array<uint64_t, guestSysRegs.size()> el1Regs_{};
    FpRegs fpRegs_;
    HypRegs hyp_;
    unsigned indexOfSp_ = 0;
  };


  /// Capture the hypervisor registers overwritten by a guest entry.
  /// Interrupts must be masked.
  HvError saveHost(SysRegAccess& regs, HostContext& host);

  /// Reload the hypervisor registers captured by saveHost. Interrupts
  /// must be masked.
  HvError restoreHost(SysRegAccess& regs, const HostContext& host);

}
