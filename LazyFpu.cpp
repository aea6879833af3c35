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

#include "LazyFpu.hpp"
#include "SysRegFields.hpp"

using namespace ArmHyp;


HvError
LazyFpu::setTrap(bool trap)
{
  CptrFields cptr;
  HvError err = regs_.readFields(SysReg::CPTR_EL2, cptr);
  if (err != HvError::None)
    return err;
  if (cptr.bits_.TFP == unsigned(trap))
    return HvError::None;
  cptr.bits_.TFP = trap;
  err = regs_.writeFields(SysReg::CPTR_EL2, cptr);
  if (err == HvError::None)
    regs_.backend().instructionBarrier();
  return err;
}


HvError
LazyFpu::saveFp(FpRegs& fp)
{
  CpuBackend& cpu = regs_.backend();
  for (unsigned i = 0; i < fp.size(); ++i)
    fp.write(i, cpu.readVecReg(i));

  uint64_t fpcr = 0, fpsr = 0;
  HvError err = regs_.read(SysReg::FPCR, fpcr);
  if (err == HvError::None)
    err = regs_.read(SysReg::FPSR, fpsr);
  fp.setFpcr(fpcr);
  fp.setFpsr(fpsr);
  return err;
}


HvError
LazyFpu::loadFp(const FpRegs& fp)
{
  CpuBackend& cpu = regs_.backend();
  for (unsigned i = 0; i < fp.size(); ++i)
    cpu.writeVecReg(i, fp.read(i));

  HvError err = regs_.write(SysReg::FPCR, fp.fpcr());
  if (err == HvError::None)
    err = regs_.write(SysReg::FPSR, fp.fpsr());
  return err;
}


HvError
LazyFpu::switchTo(FpRegs& fp, const FpuOwner& owner)
{
  // FP accesses from EL2 are trapped too while TFP is set.
  HvError err = setTrap(false);
  if (err != HvError::None)
    return err;

  if (ownerRegs_)
    {
      err = saveFp(*ownerRegs_);
      if (err != HvError::None)
        return err;
    }

  err = loadFp(fp);
  if (err != HvError::None)
    return err;

  ownerRegs_ = &fp;
  owner_ = owner;
  ++switches_;
  return HvError::None;
}


HvError
LazyFpu::trapOnEntry(VcpuContext& vcpu)
{
  bool trap = not owns(vcpu);

  CptrFields cptr(vcpu.hyp().cptr);
  cptr.bits_.TFP = trap;
  vcpu.hyp().cptr = cptr.value_;

  return setTrap(trap);
}


HvError
LazyFpu::handleTrap(uint64_t esr, VcpuContext& vcpu)
{
  EsrFields fields(esr);
  if (static_cast<ExceptionClass>(fields.bits_.EC) != ExceptionClass::FP_ACCESS)
    return HvError::InvalidArgument;

  if (not regs_.interruptsMasked())
    return HvError::InterruptsEnabled;

  if (not owns(vcpu))
    {
      HvError err = switchTo(vcpu.fpRegs(), FpuOwner{FpuOwner::Kind::Vcpu, vcpu.id()});
      if (err != HvError::None)
        return err;
    }

  CptrFields cptr(vcpu.hyp().cptr);
  cptr.bits_.TFP = 0;
  vcpu.hyp().cptr = cptr.value_;

  return setTrap(false);
}


HvError
LazyFpu::claimForHost()
{
  if (owner_.kind == FpuOwner::Kind::Host)
    return setTrap(false);

  if (not regs_.interruptsMasked())
    return HvError::InterruptsEnabled;

  return switchTo(hostFp_, FpuOwner{FpuOwner::Kind::Host, 0});
}


HvError
LazyFpu::release(VcpuContext& vcpu)
{
  if (not owns(vcpu))
    return HvError::None;

  HvError err = setTrap(false);
  if (err == HvError::None)
    err = saveFp(vcpu.fpRegs());
  if (err != HvError::None)
    return err;

  ownerRegs_ = nullptr;
  owner_ = FpuOwner{FpuOwner::Kind::None, 0};
  return HvError::None;
}
