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

#include "Stage2.hpp"
#include "SysRegFields.hpp"
#include "Vcpu.hpp"

using namespace ArmHyp;


Vcpu::Vcpu(unsigned id, const Stage2Context& stage2, const PlatformInfo& platform)
  : gasid_(stage2.gasid()), vttbr_(stage2.vttbr()), context_(id),
    timer_(platform.virtualTimerIrq, platform.physTimerIrq)
{
}


HvError
Vcpu::init(SysRegAccess& regs)
{
  if (not timer_.isInitialized())
    {
      HvError err = timer_.init(regs.physicalCounter());
      if (err != HvError::None)
        return err;
    }

  HvError err = regs.read(SysReg::HCR_EL2, context_.hyp().hcr);
  if (err != HvError::None)
    return err;

  CptrFields cptr;
  err = regs.readFields(SysReg::CPTR_EL2, cptr);
  if (err != HvError::None)
    return err;
  cptr.bits_.TFP = 1;

  context_.hyp().cptr = cptr.value_;
  context_.hyp().vttbr = vttbr_;

  // Aff0 carries the VCPU id, bit 31 is res1.
  context_.hyp().vmpidr = (uint64_t(1) << 31) | (id() & 0xff);
  err = regs.read(SysReg::VPIDR_EL2, context_.hyp().vpidr);
  if (err != HvError::None)
    return err;

  initialized_ = true;
  return HvError::None;
}


void
Vcpu::reset()
{
  context_.reset();
  timer_.reset();
}
