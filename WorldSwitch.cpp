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
#include "SysRegFields.hpp"
#include "VmManager.hpp"
#include "WorldSwitch.hpp"

using namespace ArmHyp;


WorldSwitch::WorldSwitch(SysRegAccess& regs, VmManager& vms, InterruptController& gic,
                         SchedulerHooks& scheduler, const PlatformInfo& platform)
  : regs_(regs), vms_(vms), gic_(gic), scheduler_(scheduler),
    frequency_(platform.counterFrequency), lazyFpu_(regs),
    hypTimer_(platform.hypTimerIrq)
{
}


void
WorldSwitch::enableTrace(bool flag, std::ostream* out)
{
  trace_ = flag ? (out ? out : &std::cerr) : nullptr;
}


HvError
WorldSwitch::restoreAll(Vcpu& vcpu)
{
  IrqGuard guard(regs_);

  if (current_ or vcpu.isRunning())
    return HvError::InvalidArgument;
  if (not vcpu.timer().isInitialized())
    return HvError::TimerNotInitialized;
  if (not vcpu.isInitialized())
    return HvError::InvalidArgument;

  HvError err = saveHost(regs_, host_);
  if (err != HvError::None)
    return err;

  err = vcpu.context().restoreGuest(regs_);
  if (err == HvError::None)
    err = lazyFpu_.trapOnEntry(vcpu.context());
  if (err == HvError::None)
    err = vcpu.timer().restore(regs_);
  if (err != HvError::None)
    {
      // Back to host context: guest registers may be partially loaded.
      HvError hostErr = regs_.write(SysReg::CNTV_CTL_EL0, 0);
      if (hostErr == HvError::None)
        hostErr = restoreHost(regs_, host_);
      if (hostErr != HvError::None)
        std::cerr << "Error: Core " << regs_.backend().coreId()
                  << ": failed to reload host state: " << to_string(hostErr) << '\n';
      return err;
    }

  current_ = &vcpu;
  vcpu.setRunning(true);
  return HvError::None;
}


HvError
WorldSwitch::saveAll(Vcpu& vcpu)
{
  IrqGuard guard(regs_);

  if (current_ != &vcpu)
    return HvError::InvalidArgument;

  HvError err = vcpu.context().saveGuest(regs_);
  if (err == HvError::None)
    err = vcpu.timer().save(regs_);

  // The host state is reloaded even if the guest state could not be
  // captured. The timer of a descheduled guest must not fire on the host.
  HvError hostErr = regs_.write(SysReg::CNTV_CTL_EL0, 0);
  if (hostErr == HvError::None)
    hostErr = restoreHost(regs_, host_);
  if (hostErr != HvError::None)
    return hostErr;

  current_ = nullptr;
  vcpu.setRunning(false);
  return err;
}


HvError
WorldSwitch::dispatchIrq(unsigned irq, TimerEvent& event)
{
  IrqGuard guard(regs_);
  event = TimerEvent{};

  if (irq == hypTimer_.irq())
    {
      HvError err = hypTimer_.handleIrq(regs_, event);
      if (err != HvError::None)
        return err;
      if (event.kind == TimerEvent::Kind::SliceExpired)
        {
          if (trace_)
            *trace_ << "core " << regs_.backend().coreId() << ": slice expired\n";
          scheduler_.sliceExpired(regs_.backend().coreId(), current_);
        }
      return HvError::None;
    }

  if (not current_ or irq != current_->timer().backingIrq())
    return HvError::InvalidArgument;

  Vcpu& vcpu = *current_;
  VirtualTimer& timer = vcpu.timer();

  HvError err = timer.save(regs_);
  if (err == HvError::None)
    err = timer.handlePhysIrq(regs_, event);
  if (err == HvError::None)
    err = timer.restore(regs_);
  if (err != HvError::None)
    return err;

  if (event.kind == TimerEvent::Kind::InjectVirtualIrq)
    {
      if (trace_)
        *trace_ << "core " << regs_.backend().coreId() << ": inject irq " << event.irq
                << " into vcpu " << vcpu.id() << " of guest " << vcpu.gasid() << '\n';
      gic_.injectVirtualInterrupt(vcpu, event.irq);
    }
  return HvError::None;
}


HvError
WorldSwitch::handleTrap(Vcpu& vcpu, GuestMemoryError& error)
{
  if (current_ != &vcpu)
    return HvError::InvalidArgument;

  IrqGuard guard(regs_);

  uint64_t esr = 0, far = 0, hpfar = 0;
  HvError err = regs_.read(SysReg::ESR_EL2, esr);
  if (err != HvError::None)
    return err;

  EsrFields fields(esr);
  auto ec = static_cast<ExceptionClass>(fields.bits_.EC);
  if (ec == ExceptionClass::FP_ACCESS)
    return lazyFpu_.handleTrap(esr, vcpu.context());

  if (ec != ExceptionClass::DATA_ABORT_LOWER and ec != ExceptionClass::INST_ABORT_LOWER)
    return HvError::InvalidArgument;

  err = regs_.read(SysReg::FAR_EL2, far);
  if (err == HvError::None)
    err = regs_.read(SysReg::HPFAR_EL2, hpfar);
  if (err != HvError::None)
    return err;

  AbortInfo info;
  err = decodeAbort(esr, far, hpfar, info);
  if (err != HvError::None)
    return err;

  err = vms_.handleStage2Abort(vcpu.gasid(), info, error);
  if (err == HvError::None and trace_)
    *trace_ << "core " << regs_.backend().coreId() << ": resolved lazy fault at 0x"
            << std::hex << info.ipa << std::dec << " for guest " << vcpu.gasid() << '\n';
  return err;
}


HvError
WorldSwitch::armSlice(uint64_t us)
{
  return hypTimer_.armSlice(regs_, usToTicks(us, frequency_));
}


HvError
WorldSwitch::releaseVcpu(Vcpu& vcpu)
{
  if (current_ == &vcpu)
    return HvError::InvalidArgument;

  IrqGuard guard(regs_);
  return lazyFpu_.release(vcpu.context());
}
