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

#include <iomanip>
#include <iostream>
#include "VcpuContext.hpp"

using namespace ArmHyp;


VcpuContext::VcpuContext(unsigned id)
  : id_(id), indexOfSp_(spIndex())
{
  reset();
}


bool
VcpuContext::guestRegIndex(SysReg reg, unsigned& ix)
{
  for (unsigned i = 0; i < guestSysRegs.size(); ++i)
    if (guestSysRegs.at(i) == reg)
      {
        ix = i;
        return true;
      }
  return false;
}


unsigned
VcpuContext::spIndex()
{
  unsigned ix = 0;
  if (not guestRegIndex(SysReg::SP_EL1, ix))
    return 0;
  return ix;
}


bool
VcpuContext::sysReg(SysReg reg, uint64_t& value) const
{
  unsigned ix = 0;
  if (not guestRegIndex(reg, ix))
    return false;
  value = el1Regs_.at(ix);
  return true;
}


bool
VcpuContext::setSysReg(SysReg reg, uint64_t value)
{
  unsigned ix = 0;
  if (not guestRegIndex(reg, ix))
    return false;
  el1Regs_.at(ix) = value;
  return true;
}


void
VcpuContext::reset()
{
  intRegs_.reset();
  fpRegs_.reset();
  pc_ = 0;
  pstate_ = resetPstate;
  el1Regs_.fill(0);

  unsigned ix = 0;
  if (guestRegIndex(SysReg::SCTLR_EL1, ix))
    el1Regs_.at(ix) = resetSctlrEl1;
}


HvError
VcpuContext::saveGuest(SysRegAccess& regs)
{
  if (not regs.interruptsMasked())
    return HvError::InterruptsEnabled;

  CpuBackend& cpu = regs.backend();
  for (unsigned i = 0; i < intRegs_.size(); ++i)
    intRegs_.write(i, cpu.readGpr(i));

  HvError err = regs.read(SysReg::ELR_EL2, pc_);
  if (err == HvError::None)
    err = regs.read(SysReg::SPSR_EL2, pstate_);

  for (unsigned i = 0; i < guestSysRegs.size() and err == HvError::None; ++i)
    err = regs.read(guestSysRegs.at(i), el1Regs_.at(i));

  if (err == HvError::None)
    err = regs.read(SysReg::HCR_EL2, hyp_.hcr);
  if (err == HvError::None)
    err = regs.read(SysReg::VTTBR_EL2, hyp_.vttbr);
  if (err == HvError::None)
    err = regs.read(SysReg::CPTR_EL2, hyp_.cptr);
  if (err == HvError::None)
    err = regs.read(SysReg::VMPIDR_EL2, hyp_.vmpidr);
  if (err == HvError::None)
    err = regs.read(SysReg::VPIDR_EL2, hyp_.vpidr);

  return err;
}


HvError
VcpuContext::restoreGuest(SysRegAccess& regs) const
{
  if (not regs.interruptsMasked())
    return HvError::InterruptsEnabled;

  // Translation regime first so that nothing runs with a stale VMID.
  HvError err = regs.write(SysReg::VTTBR_EL2, hyp_.vttbr);
  if (err == HvError::None)
    err = regs.write(SysReg::HCR_EL2, hyp_.hcr);
  if (err == HvError::None)
    err = regs.write(SysReg::CPTR_EL2, hyp_.cptr);
  if (err == HvError::None)
    err = regs.write(SysReg::VMPIDR_EL2, hyp_.vmpidr);
  if (err == HvError::None)
    err = regs.write(SysReg::VPIDR_EL2, hyp_.vpidr);

  for (unsigned i = 0; i < guestSysRegs.size() and err == HvError::None; ++i)
    err = regs.write(guestSysRegs.at(i), el1Regs_.at(i));

  if (err == HvError::None)
    err = regs.write(SysReg::ELR_EL2, pc_);
  if (err == HvError::None)
    err = regs.write(SysReg::SPSR_EL2, pstate_);
  if (err != HvError::None)
    return err;

  CpuBackend& cpu = regs.backend();
  for (unsigned i = 0; i < intRegs_.size(); ++i)
    cpu.writeGpr(i, intRegs_.read(i));

  cpu.instructionBarrier();
  return HvError::None;
}


HvError
ArmHyp::saveHost(SysRegAccess& regs, HostContext& host)
{
  if (not regs.interruptsMasked())
    return HvError::InterruptsEnabled;

  HvError err = regs.read(SysReg::HCR_EL2, host.hcr);
  if (err == HvError::None)
    err = regs.read(SysReg::VTTBR_EL2, host.vttbr);
  if (err == HvError::None)
    err = regs.read(SysReg::CPTR_EL2, host.cptr);
  if (err == HvError::None)
    err = regs.read(SysReg::TPIDR_EL2, host.tpidr);
  if (err == HvError::None)
    err = regs.read(SysReg::MDCR_EL2, host.mdcr);
  if (err == HvError::None)
    err = regs.read(SysReg::HSTR_EL2, host.hstr);
  return err;
}


HvError
ArmHyp::restoreHost(SysRegAccess& regs, const HostContext& host)
{
  if (not regs.interruptsMasked())
    return HvError::InterruptsEnabled;

  HvError err = regs.write(SysReg::HCR_EL2, host.hcr);
  if (err == HvError::None)
    err = regs.write(SysReg::VTTBR_EL2, host.vttbr);
  if (err == HvError::None)
    err = regs.write(SysReg::CPTR_EL2, host.cptr);
  if (err == HvError::None)
    err = regs.write(SysReg::TPIDR_EL2, host.tpidr);
  if (err == HvError::None)
    err = regs.write(SysReg::MDCR_EL2, host.mdcr);
  if (err == HvError::None)
    err = regs.write(SysReg::HSTR_EL2, host.hstr);
  if (err == HvError::None)
    regs.backend().instructionBarrier();
  return err;
}


void
VcpuContext::print(std::ostream& out, bool abiNames) const
{
  auto line = [&out](std::string_view name, uint64_t value) {
    out << std::left << std::setw(16) << std::setfill(' ') << name << std::right
        << " 0x" << std::hex << std::setfill('0') << std::setw(16) << value
        << std::setfill(' ') << std::dec << '\n';
  };

  for (unsigned i = 0; i < intRegs_.size(); ++i)
    line(IntRegs::regName(i, abiNames), intRegs_.read(i));
  line("pc", pc_);
  line("pstate", pstate_);
  for (unsigned i = 0; i < guestSysRegs.size(); ++i)
    line(sysRegName(guestSysRegs.at(i)), el1Regs_.at(i));
}
