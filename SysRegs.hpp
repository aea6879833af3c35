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
#include <string_view>
#include "trapEnums.hpp"

namespace ArmHyp
{

  /// System registers touched by the hypervisor core.
  enum class SysReg : uint32_t
    {
      // Hypervisor control.
      HCR_EL2,
      VTCR_EL2,
      VTTBR_EL2,
      SCTLR_EL2,
      CPTR_EL2,
      HSTR_EL2,
      MDCR_EL2,
      MAIR_EL2,
      VPIDR_EL2,
      VMPIDR_EL2,
      ESR_EL2,
      FAR_EL2,
      HPFAR_EL2,
      ELR_EL2,
      SPSR_EL2,
      TPIDR_EL2,
      CNTHCTL_EL2,
      CNTVOFF_EL2,
      CNTHP_CTL_EL2,
      CNTHP_CVAL_EL2,

      // Guest kernel and application state.
      SCTLR_EL1,
      ACTLR_EL1,
      CPACR_EL1,
      TTBR0_EL1,
      TTBR1_EL1,
      TCR_EL1,
      MAIR_EL1,
      AMAIR_EL1,
      VBAR_EL1,
      CONTEXTIDR_EL1,
      TPIDR_EL0,
      TPIDRRO_EL0,
      TPIDR_EL1,
      ESR_EL1,
      FAR_EL1,
      AFSR0_EL1,
      AFSR1_EL1,
      PAR_EL1,
      SP_EL0,
      SP_EL1,
      ELR_EL1,
      SPSR_EL1,
      CSSELR_EL1,
      CNTKCTL_EL1,
      CNTV_CTL_EL0,
      CNTV_CVAL_EL0,

      // Status, counter and FP control.
      CurrentEL,
      DAIF,
      CNTPCT_EL0,
      CNTFRQ_EL0,
      FPCR,
      FPSR,

      Count_
    };


  constexpr unsigned sysRegCount = static_cast<unsigned>(SysReg::Count_);


  /// Return the architectural name of the given register.
  std::string_view sysRegName(SysReg reg);

  /// Return the least privileged level from which the given register
  /// may be accessed.
  PrivilegeLevel sysRegMinLevel(SysReg reg);

  /// Set reg to the register with the given architectural name
  /// (case insensitive). Return true on success and false if no such
  /// register.
  bool findSysReg(std::string_view name, SysReg& reg);


  /// Guest EL1/EL0 registers captured in a VCPU context, in save order.
  inline constexpr std::array guestSysRegs = {
    SysReg::SCTLR_EL1, SysReg::ACTLR_EL1, SysReg::CPACR_EL1,
    SysReg::TTBR0_EL1, SysReg::TTBR1_EL1, SysReg::TCR_EL1,
    SysReg::MAIR_EL1, SysReg::AMAIR_EL1, SysReg::VBAR_EL1,
    SysReg::CONTEXTIDR_EL1, SysReg::TPIDR_EL0, SysReg::TPIDRRO_EL0,
    SysReg::TPIDR_EL1, SysReg::ESR_EL1, SysReg::FAR_EL1,
    SysReg::AFSR0_EL1, SysReg::AFSR1_EL1, SysReg::PAR_EL1,
    SysReg::SP_EL0, SysReg::SP_EL1, SysReg::ELR_EL1, SysReg::SPSR_EL1,
    SysReg::CSSELR_EL1, SysReg::CNTKCTL_EL1
  };
}
