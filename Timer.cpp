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

#include "Timer.hpp"
#include "SysRegFields.hpp"
#include "util.hpp"

using namespace ArmHyp;


namespace
{
  // Return value * mul / div saturating at the largest uint64_t. The
  // product mul * div must fit in 64 bits.
  uint64_t
  scale(uint64_t value, uint64_t mul, uint64_t div)
  {
    if (div == 0)
      return 0;
    uint64_t whole = util::saturatingMul(value / div, mul);
    uint64_t part = (value % div) * mul / div;
    if (whole > UINT64_MAX - part)
      return UINT64_MAX;
    return whole + part;
  }
}


uint64_t
ArmHyp::ticksToNs(uint64_t ticks, uint64_t freq)
{
  return scale(ticks, 1'000'000'000, freq);
}


uint64_t
ArmHyp::nsToTicks(uint64_t ns, uint64_t freq)
{
  return scale(ns, freq, 1'000'000'000);
}


uint64_t
ArmHyp::usToTicks(uint64_t us, uint64_t freq)
{
  return scale(us, freq, 1'000'000);
}


HvError
VirtualTimer::init(uint64_t offset)
{
  if (initialized_)
    return HvError::InvalidArgument;
  offset_ = offset;
  initialized_ = true;
  return HvError::None;
}


HvError
VirtualTimer::readVirtualCounter(const SysRegAccess& regs, uint64_t& value) const
{
  if (not initialized_)
    return HvError::TimerNotInitialized;
  value = counterSub(regs.physicalCounter(), offset_);
  return HvError::None;
}


HvError
VirtualTimer::setTimerTicks(const SysRegAccess& regs, uint64_t ticks)
{
  uint64_t now = 0;
  if (auto err = readVirtualCounter(regs, now); err != HvError::None)
    return err;
  cval_ = counterAdd(now, ticks);
  return HvError::None;
}


HvError
VirtualTimer::setTimerCval(uint64_t cval)
{
  if (not initialized_)
    return HvError::TimerNotInitialized;
  cval_ = cval & counterMask;
  return HvError::None;
}


HvError
VirtualTimer::hasExpired(const SysRegAccess& regs, bool& expired) const
{
  uint64_t now = 0;
  if (auto err = readVirtualCounter(regs, now); err != HvError::None)
    return err;
  expired = counterReached(now, cval_);
  return HvError::None;
}


HvError
VirtualTimer::remainingTicks(const SysRegAccess& regs, uint64_t& ticks) const
{
  uint64_t now = 0;
  if (auto err = readVirtualCounter(regs, now); err != HvError::None)
    return err;
  ticks = counterReached(now, cval_) ? 0 : counterSub(cval_, now);
  return HvError::None;
}


HvError
VirtualTimer::handlePhysIrq(const SysRegAccess& regs, TimerEvent& event)
{
  event = TimerEvent{};

  bool expired = false;
  if (auto err = hasExpired(regs, expired); err != HvError::None)
    return err;

  if (expired)
    {
      event.kind = TimerEvent::Kind::InjectVirtualIrq;
      event.irq = virtualIrq_;
      stop();
    }
  return HvError::None;
}


HvError
VirtualTimer::save(const SysRegAccess& regs)
{
  if (not initialized_)
    return HvError::TimerNotInitialized;

  uint64_t ctl = 0, cval = 0, offset = 0;
  if (auto err = regs.read(SysReg::CNTV_CTL_EL0, ctl); err != HvError::None)
    return err;
  if (auto err = regs.read(SysReg::CNTV_CVAL_EL0, cval); err != HvError::None)
    return err;
  if (auto err = regs.read(SysReg::CNTVOFF_EL2, offset); err != HvError::None)
    return err;

  ctl_ = ctl;
  cval_ = cval & counterMask;
  offset_ = offset;
  return HvError::None;
}


HvError
VirtualTimer::restore(SysRegAccess& regs) const
{
  if (not initialized_)
    return HvError::TimerNotInitialized;

  // Offset first so the compare value is never evaluated against a
  // stale virtual counter.
  TimerCtlFields ctl(ctl_);
  ctl.bits_.ISTATUS = 0;
  if (auto err = regs.write(SysReg::CNTVOFF_EL2, offset_); err != HvError::None)
    return err;
  if (auto err = regs.write(SysReg::CNTV_CVAL_EL0, cval_); err != HvError::None)
    return err;
  return regs.write(SysReg::CNTV_CTL_EL0, ctl.value_);
}


void
VirtualTimer::start()
{
  TimerCtlFields ctl(ctl_);
  ctl.bits_.IMASK = 0;
  ctl.bits_.ENABLE = 1;
  ctl_ = ctl.value_;
}


void
VirtualTimer::stop()
{
  TimerCtlFields ctl(ctl_);
  ctl.bits_.ENABLE = 0;
  ctl.bits_.IMASK = 1;
  ctl_ = ctl.value_;
}


bool
VirtualTimer::isEnabled() const
{
  return TimerCtlFields(ctl_).bits_.ENABLE;
}


bool
VirtualTimer::isMasked() const
{
  return TimerCtlFields(ctl_).bits_.IMASK;
}


bool
VirtualTimer::isPending() const
{
  return TimerCtlFields(ctl_).bits_.ISTATUS;
}


HvError
HypervisorTimer::armSlice(SysRegAccess& regs, uint64_t ticks)
{
  cval_ = counterAdd(regs.physicalCounter(), ticks);
  start();
  return restore(regs);
}


HvError
HypervisorTimer::cancel(SysRegAccess& regs)
{
  stop();
  return regs.write(SysReg::CNTHP_CTL_EL2, ctl_);
}


HvError
HypervisorTimer::hasExpired(const SysRegAccess& regs, bool& expired) const
{
  expired = counterReached(regs.physicalCounter() & counterMask, cval_);
  return HvError::None;
}


HvError
HypervisorTimer::remainingTicks(const SysRegAccess& regs, uint64_t& ticks) const
{
  uint64_t now = regs.physicalCounter() & counterMask;
  ticks = counterReached(now, cval_) ? 0 : counterSub(cval_, now);
  return HvError::None;
}


HvError
HypervisorTimer::handleIrq(SysRegAccess& regs, TimerEvent& event)
{
  event = TimerEvent{};

  bool expired = false;
  if (auto err = hasExpired(regs, expired); err != HvError::None)
    return err;

  if (not expired or not isEnabled())
    return HvError::None;

  stop();
  if (auto err = regs.write(SysReg::CNTHP_CTL_EL2, ctl_); err != HvError::None)
    return err;

  event.kind = TimerEvent::Kind::SliceExpired;
  event.irq = irq_;
  return HvError::None;
}


HvError
HypervisorTimer::save(const SysRegAccess& regs)
{
  uint64_t ctl = 0, cval = 0;
  if (auto err = regs.read(SysReg::CNTHP_CTL_EL2, ctl); err != HvError::None)
    return err;
  if (auto err = regs.read(SysReg::CNTHP_CVAL_EL2, cval); err != HvError::None)
    return err;
  ctl_ = ctl;
  cval_ = cval & counterMask;
  return HvError::None;
}


HvError
HypervisorTimer::restore(SysRegAccess& regs) const
{
  TimerCtlFields ctl(ctl_);
  ctl.bits_.ISTATUS = 0;
  if (auto err = regs.write(SysReg::CNTHP_CVAL_EL2, cval_); err != HvError::None)
    return err;
  return regs.write(SysReg::CNTHP_CTL_EL2, ctl.value_);
}


void
HypervisorTimer::start()
{
  TimerCtlFields ctl(ctl_);
  ctl.bits_.IMASK = 0;
  ctl.bits_.ENABLE = 1;
  ctl_ = ctl.value_;
}


void
HypervisorTimer::stop()
{
  TimerCtlFields ctl(ctl_);
  ctl.bits_.ENABLE = 0;
  ctl.bits_.IMASK = 1;
  ctl_ = ctl.value_;
}


bool
HypervisorTimer::isEnabled() const
{
  return TimerCtlFields(ctl_).bits_.ENABLE;
}


bool
HypervisorTimer::isMasked() const
{
  return TimerCtlFields(ctl_).bits_.IMASK;
}


bool
HypervisorTimer::isPending() const
{
  return TimerCtlFields(ctl_).bits_.ISTATUS;
}
