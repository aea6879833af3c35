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

#include <iostream>
#include <string>
#include "El2Bootstrap.hpp"
#include "SysRegFields.hpp"

using namespace ArmHyp;


namespace
{

  HvError
  programHcr(SysRegAccess& regs)
  {
    HcrFields hcr;
    HvError err = regs.readFields(SysReg::HCR_EL2, hcr);
    if (err != HvError::None)
      return err;
    hcr.bits_.VM = 1;
    hcr.bits_.INST_OVR = 1;
    hcr.bits_.DATA_OVR = 1;
    hcr.bits_.DC_OVR = 1;
    hcr.bits_.FMO = 0;
    hcr.bits_.CD = 0;
    return regs.writeFields(SysReg::HCR_EL2, hcr);
  }


  HvError
  programSctlr(SysRegAccess& regs, const El2Options& options)
  {
    SctlrFields sctlr;
    HvError err = regs.readFields(SysReg::SCTLR_EL2, sctlr);
    if (err != HvError::None)
      return err;
    sctlr.bits_.C = 1;
    sctlr.bits_.I = 1;
    sctlr.bits_.A = options.alignmentCheck;
    sctlr.bits_.WXN = options.wxn;
    sctlr.bits_.SA = 0;
    return regs.writeFields(SysReg::SCTLR_EL2, sctlr);
  }


  HvError
  programCptr(SysRegAccess& regs)
  {
    CptrFields cptr;
    HvError err = regs.readFields(SysReg::CPTR_EL2, cptr);
    if (err != HvError::None)
      return err;
    cptr.bits_.TFP = 1;
    return regs.writeFields(SysReg::CPTR_EL2, cptr);
  }


  HvError
  programCnthctl(SysRegAccess& regs)
  {
    CnthctlFields cnthctl;
    HvError err = regs.readFields(SysReg::CNTHCTL_EL2, cnthctl);
    if (err != HvError::None)
      return err;
    cnthctl.bits_.EL1PCTEN = 1;
    cnthctl.bits_.EL1PCEN = 1;
    return regs.writeFields(SysReg::CNTHCTL_EL2, cnthctl);
  }

}


HvError
ArmHyp::initializeHypervisorMode(SysRegAccess& regs, const El2Options& options)
{
  PrivilegeLevel level = regs.currentLevel();
  if (level != PrivilegeLevel::El2)
    {
      std::cerr << "Error: Core " << regs.backend().coreId() << " running at "
                << to_string(level) << ", hypervisor mode requires EL2\n";
      return HvError::WrongPrivilegeLevel;
    }

  std::string message;
  if (not options.stage2.validate(message))
    {
      std::cerr << "Error: Invalid stage-2 configuration: " << message << '\n';
      return HvError::InvalidArgument;
    }

  HvError err = programHcr(regs);
  if (err == HvError::None)
    err = regs.write(SysReg::VTCR_EL2, options.stage2.encode());
  if (err == HvError::None)
    err = programSctlr(regs, options);
  if (err == HvError::None)
    err = regs.write(SysReg::MAIR_EL2, options.mair);
  if (err == HvError::None)
    err = programCptr(regs);
  if (err == HvError::None)
    err = regs.write(SysReg::HSTR_EL2, 0);
  if (err == HvError::None)
    err = programCnthctl(regs);
  if (err == HvError::None)
    err = regs.write(SysReg::CNTVOFF_EL2, 0);

  if (err != HvError::None)
    {
      std::cerr << "Error: Failed to enter hypervisor mode on core "
                << regs.backend().coreId() << ": " << to_string(err) << '\n';
      return err;
    }

  // Nothing cached from before stage 2 was configured may be used.
  CpuBackend& cpu = regs.backend();
  cpu.instructionBarrier();
  cpu.tlbInvalidateAll();
  cpu.dataBarrier();
  cpu.instructionBarrier();

  return HvError::None;
}
