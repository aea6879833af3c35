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
#include "CpuBackend.hpp"
#include "SysRegFields.hpp"
#include "trapEnums.hpp"

namespace ArmHyp
{

  /// Checked access to the system registers of one physical core. An
  /// access to a register that is not reachable from the current
  /// exception level is refused with WrongPrivilegeLevel and never
  /// reaches the hardware.
  class SysRegAccess
  {
  public:

    explicit SysRegAccess(CpuBackend& cpu)
      : cpu_(cpu)
    { }

    /// Return the exception level the core is running at.
    PrivilegeLevel currentLevel() const;

    /// Set value to the contents of the given register.
    HvError read(SysReg reg, uint64_t& value) const;

    /// Set the given register to value.
    HvError write(SysReg reg, uint64_t value);

    /// Read a register into one of the field unions of SysRegFields.hpp.
    template <typename FIELDS>
    HvError readFields(SysReg reg, FIELDS& fields) const
    { return read(reg, fields.value_); }

    /// Write a register from one of the field unions of SysRegFields.hpp.
    template <typename FIELDS>
    HvError writeFields(SysReg reg, const FIELDS& fields)
    { return write(reg, fields.value_); }

    /// Return the value of the free-running physical counter.
    uint64_t physicalCounter() const
    { return cpu_.readSysReg(SysReg::CNTPCT_EL0); }

    /// Return the counter frequency in Hz.
    uint64_t counterFrequency() const
    { return cpu_.readSysReg(SysReg::CNTFRQ_EL0); }

    /// Return true if IRQs are masked on this core.
    bool interruptsMasked() const;

    /// Mask IRQs and FIQs returning the previous DAIF value.
    uint64_t maskInterrupts();

    /// Restore a DAIF value returned by maskInterrupts.
    void restoreInterrupts(uint64_t daif);

    /// Return the underlying backend for general purpose, SIMD and TLB
    /// operations.
    CpuBackend& backend() const
    { return cpu_; }

  private:

    CpuBackend& cpu_;
  };


  /// Mask interrupts on construction and restore the previous mask on
  /// destruction.
  class IrqGuard
  {
  public:

    explicit IrqGuard(SysRegAccess& regs)
      : regs_(regs), saved_(regs.maskInterrupts())
    { }

    ~IrqGuard()
    { regs_.restoreInterrupts(saved_); }

    IrqGuard(const IrqGuard&) = delete;
    IrqGuard& operator=(const IrqGuard&) = delete;

  private:

    SysRegAccess& regs_;
    uint64_t saved_;
  };

}
