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

#include "SysRegAccess.hpp"


using namespace ArmHyp;


PrivilegeLevel
SysRegAccess::currentLevel() const
{
  // CurrentEL holds the level in bits 3:2.
  uint64_t value = cpu_.readSysReg(SysReg::CurrentEL);
  return static_cast<PrivilegeLevel>((value >> 2) & 3);
}


HvError
SysRegAccess::read(SysReg reg, uint64_t& value) const
{
  if (currentLevel() < sysRegMinLevel(reg))
    return HvError::WrongPrivilegeLevel;
  value = cpu_.readSysReg(reg);
  return HvError::None;
}


HvError
SysRegAccess::write(SysReg reg, uint64_t value)
{
  if (reg == SysReg::CurrentEL or reg == SysReg::CNTPCT_EL0)
    return HvError::InvalidArgument;  // Read only.
  if (currentLevel() < sysRegMinLevel(reg))
    return HvError::WrongPrivilegeLevel;
  cpu_.writeSysReg(reg, value);
  return HvError::None;
}


bool
SysRegAccess::interruptsMasked() const
{
  SpsrFields daif(cpu_.readSysReg(SysReg::DAIF));
  return daif.bits_.I;
}


uint64_t
SysRegAccess::maskInterrupts()
{
  SpsrFields daif(cpu_.readSysReg(SysReg::DAIF));
  uint64_t prev = daif.value_;
  daif.bits_.I = 1;
  daif.bits_.F = 1;
  cpu_.writeSysReg(SysReg::DAIF, daif.value_);
  return prev;
}


void
SysRegAccess::restoreInterrupts(uint64_t daif)
{
  cpu_.writeSysReg(SysReg::DAIF, daif);
}
