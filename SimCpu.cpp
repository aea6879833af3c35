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

#include "SimCpu.hpp"
#include "SysRegFields.hpp"
#include "Timer.hpp"

using namespace ArmHyp;


SimCpu::SimCpu(unsigned coreId, std::shared_ptr<Tlb> tlb)
  : coreId_(coreId), tlb_(std::move(tlb))
{
  if (not tlb_)
    tlb_ = std::make_shared<Tlb>(defaultTlbSize);

  pokeSysReg(SysReg::CNTFRQ_EL0, defaultCounterFrequency);
}


uint64_t
SimCpu::readSysReg(SysReg reg)
{
  uint64_t value = sysRegs_.at(static_cast<unsigned>(reg));

  switch (reg)
    {
    case SysReg::CurrentEL:
      return static_cast<uint64_t>(level_) << 2;

    case SysReg::CNTPCT_EL0:
      return counter_;

    case SysReg::CNTV_CTL_EL0:
      {
        // ISTATUS reflects the timer condition of the virtual counter.
        TimerCtlFields ctl(value);
        uint64_t vcount = counterSub(counter_, readSysReg(SysReg::CNTVOFF_EL2));
        uint64_t cval = readSysReg(SysReg::CNTV_CVAL_EL0);
        ctl.bits_.ISTATUS = ctl.bits_.ENABLE and counterReached(vcount, cval);
        return ctl.value_;
      }

    case SysReg::CNTHP_CTL_EL2:
      {
        TimerCtlFields ctl(value);
        uint64_t cval = readSysReg(SysReg::CNTHP_CVAL_EL2);
        ctl.bits_.ISTATUS = ctl.bits_.ENABLE and counterReached(counter_ & counterMask, cval);
        return ctl.value_;
      }

    default:
      return value;
    }
}


void
SimCpu::writeSysReg(SysReg reg, uint64_t value)
{
  ++writeCount_;

  if (reg == SysReg::CurrentEL or reg == SysReg::CNTPCT_EL0)
    return;  // Read only.

  if (reg == SysReg::CNTV_CTL_EL0 or reg == SysReg::CNTHP_CTL_EL2)
    {
      TimerCtlFields ctl(value);
      ctl.bits_.ISTATUS = 0;
      value = ctl.value_;
    }

  sysRegs_.at(static_cast<unsigned>(reg)) = value;
}


void
SimCpu::tlbInvalidateIpa(uint32_t vmid, uint64_t ipa)
{
  ++tlbiCount_;
  tlb_->invalidateIpaVmid(ipa >> 12, vmid);
}


void
SimCpu::tlbInvalidateVmid(uint32_t vmid)
{
  ++tlbiCount_;
  tlb_->invalidateVmid(vmid);
}


void
SimCpu::tlbInvalidateAll()
{
  ++tlbiCount_;
  tlb_->invalidate();
}
