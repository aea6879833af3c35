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

#include <boost/algorithm/string.hpp>
#include "SysRegs.hpp"


using namespace ArmHyp;


namespace
{
  struct SysRegInfo
  {
    std::string_view name;
    PrivilegeLevel minLevel;
  };

  using PL = PrivilegeLevel;

  constexpr std::array<SysRegInfo, sysRegCount> sysRegTable = {{
    { "HCR_EL2",        PL::El2 },
    { "VTCR_EL2",       PL::El2 },
    { "VTTBR_EL2",      PL::El2 },
    { "SCTLR_EL2",      PL::El2 },
    { "CPTR_EL2",       PL::El2 },
    { "HSTR_EL2",       PL::El2 },
    { "MDCR_EL2",       PL::El2 },
    { "MAIR_EL2",       PL::El2 },
    { "VPIDR_EL2",      PL::El2 },
    { "VMPIDR_EL2",     PL::El2 },
    { "ESR_EL2",        PL::El2 },
    { "FAR_EL2",        PL::El2 },
    { "HPFAR_EL2",      PL::El2 },
    { "ELR_EL2",        PL::El2 },
    { "SPSR_EL2",       PL::El2 },
    { "TPIDR_EL2",      PL::El2 },
    { "CNTHCTL_EL2",    PL::El2 },
    { "CNTVOFF_EL2",    PL::El2 },
    { "CNTHP_CTL_EL2",  PL::El2 },
    { "CNTHP_CVAL_EL2", PL::El2 },

    { "SCTLR_EL1",      PL::El1 },
    { "ACTLR_EL1",      PL::El1 },
    { "CPACR_EL1",      PL::El1 },
    { "TTBR0_EL1",      PL::El1 },
    { "TTBR1_EL1",      PL::El1 },
    { "TCR_EL1",        PL::El1 },
    { "MAIR_EL1",       PL::El1 },
    { "AMAIR_EL1",      PL::El1 },
    { "VBAR_EL1",       PL::El1 },
    { "CONTEXTIDR_EL1", PL::El1 },
    { "TPIDR_EL0",      PL::El0 },
    { "TPIDRRO_EL0",    PL::El0 },
    { "TPIDR_EL1",      PL::El1 },
    { "ESR_EL1",        PL::El1 },
    { "FAR_EL1",        PL::El1 },
    { "AFSR0_EL1",      PL::El1 },
    { "AFSR1_EL1",      PL::El1 },
    { "PAR_EL1",        PL::El1 },
    { "SP_EL0",         PL::El1 },
    { "SP_EL1",         PL::El2 },
    { "ELR_EL1",        PL::El1 },
    { "SPSR_EL1",       PL::El1 },
    { "CSSELR_EL1",     PL::El1 },
    { "CNTKCTL_EL1",    PL::El1 },
    { "CNTV_CTL_EL0",   PL::El0 },
    { "CNTV_CVAL_EL0",  PL::El0 },

    { "CurrentEL",      PL::El1 },
    { "DAIF",           PL::El0 },
    { "CNTPCT_EL0",     PL::El0 },
    { "CNTFRQ_EL0",     PL::El0 },
    { "FPCR",           PL::El0 },
    { "FPSR",           PL::El0 }
  }};
}


std::string_view
ArmHyp::sysRegName(SysReg reg)
{
  auto ix = static_cast<unsigned>(reg);
  if (ix >= sysRegTable.size())
    return "?";
  return sysRegTable.at(ix).name;
}


PrivilegeLevel
ArmHyp::sysRegMinLevel(SysReg reg)
{
  auto ix = static_cast<unsigned>(reg);
  if (ix >= sysRegTable.size())
    return PrivilegeLevel::El3;
  return sysRegTable.at(ix).minLevel;
}


bool
ArmHyp::findSysReg(std::string_view name, SysReg& reg)
{
  for (unsigned ix = 0; ix < sysRegTable.size(); ++ix)
    if (boost::iequals(sysRegTable.at(ix).name, name))
      {
        reg = static_cast<SysReg>(ix);
        return true;
      }
  return false;
}
