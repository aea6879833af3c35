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
#include "El2Bootstrap.hpp"
#include "Session.hpp"
#include "Stage2Fault.hpp"
#include "SysRegFields.hpp"


using namespace ArmHyp;


/// Interrupt controller of the simulated system: records injected
/// interrupts.
class Session::ConsoleGic : public InterruptController
{
public:

  void injectVirtualInterrupt(const Vcpu& vcpu, unsigned irq) override
  {
    ++count_;
    if (trace_)
      std::cerr << "gic: vcpu " << vcpu.id() << " of guest " << vcpu.gasid()
                << " pending irq " << irq << '\n';
  }

  uint64_t count() const
  { return count_; }

  void enableTrace(bool flag)
  { trace_ = flag; }

private:

  uint64_t count_ = 0;
  bool trace_ = false;
};


/// Scheduler of the simulated system: records slice expiries.
class Session::ConsoleScheduler : public SchedulerHooks
{
public:

  void sliceExpired(unsigned coreId, Vcpu* running) override
  {
    ++count_;
    if (trace_)
      {
        std::cerr << "scheduler: core " << coreId << " slice expired";
        if (running)
          std::cerr << " (vcpu " << running->id() << " of guest " << running->gasid() << ')';
        std::cerr << '\n';
      }
  }

  uint64_t count() const
  { return count_; }

  void enableTrace(bool flag)
  { trace_ = flag; }

private:

  uint64_t count_ = 0;
  bool trace_ = false;
};


Session::Session()
  : gic_(std::make_unique<ConsoleGic>()),
    scheduler_(std::make_unique<ConsoleScheduler>())
{
}


Session::~Session()
{
  // Write back live FP state before the VCPUs go away.
  for (auto& vcpu : vcpus_)
    for (auto& ws : switches_)
      if (ws->current() != vcpu.get())
        {
          HvError err = ws->releaseVcpu(*vcpu);
          if (err != HvError::None)
            std::cerr << "Warning: Failed to release FP state of vcpu " << vcpu->id()
                      << ": " << to_string(err) << '\n';
        }
}


uint64_t
Session::injectedCount() const
{
  return gic_->count();
}


uint64_t
Session::sliceExpiryCount() const
{
  return scheduler_->count();
}


bool
Session::defineSystem(const Args& args, const HvConfig& config)
{
  params_ = HvParams{};
  if (not config.applyConfig(params_))
    return false;

  if (args.cores)
    params_.cores = *args.cores;
  if (args.sliceUs)
    params_.sliceUs = *args.sliceUs;

  unsigned tlbSize = args.tlbSize ? unsigned(*args.tlbSize) : SimCpu::defaultTlbSize;
  tlb_ = std::make_shared<Tlb>(tlbSize);

  cores_.clear();
  regs_.clear();
  for (unsigned ix = 0; ix < params_.cores; ++ix)
    {
      auto cpu = std::make_unique<SimCpu>(ix, tlb_);
      cpu->pokeSysReg(SysReg::CNTFRQ_EL0, params_.platform.counterFrequency);
      regs_.push_back(std::make_unique<SysRegAccess>(*cpu));
      cores_.push_back(std::move(cpu));
    }

  gasids_ = std::make_unique<GasidAllocator>();
  arena_ = std::make_unique<PageTableArena>(params_.poolBase, params_.poolTables);
  vms_ = std::make_unique<VmManager>(*gasids_, *arena_, *cores_.at(0), params_.el2.stage2);

  switches_.clear();
  for (unsigned ix = 0; ix < params_.cores; ++ix)
    switches_.push_back(std::make_unique<WorldSwitch>(*regs_.at(ix), *vms_, *gic_,
                                                      *scheduler_, params_.platform));

  if (args.trace)
    {
      vms_->enableTrace(true);
      gic_->enableTrace(true);
      scheduler_->enableTrace(true);
      for (auto& ws : switches_)
        ws->enableTrace(true);
    }

  if (args.verbose)
    std::cerr << "Defined system: " << params_.cores << " core(s), "
              << params_.poolTables << " translation tables at 0x" << std::hex
              << params_.poolBase << std::dec << ", " << params_.guests.size()
              << " guest(s)\n";

  return true;
}


bool
Session::configureSystem(const Args& args)
{
  if (not vms_)
    return false;

  for (auto& regs : regs_)
    if (initializeHypervisorMode(*regs, params_.el2) != HvError::None)
      return false;

  unsigned vcpuId = 0;

  for (unsigned gix = 0; gix < params_.guests.size(); ++gix)
    {
      const GuestParams& guest = params_.guests.at(gix);

      Gasid gasid = 0;
      HvError err = vms_->createGuest(gasid);
      if (err != HvError::None)
        {
          std::cerr << "Error: Failed to create guest " << gix << ": " << to_string(err) << '\n';
          return false;
        }
      guestIds_.push_back(gasid);

      for (const MemoryRegion& region : guest.memory)
        {
          if (region.lazy)
            err = vms_->addLazyRegion(gasid, region.ipa, region.hpa, region.size, region.attrs);
          else
            err = vms_->map(gasid, region.ipa, region.hpa, region.size, region.attrs);
          if (err != HvError::None)
            {
              std::cerr << "Error: Failed to map guest " << gix << " region 0x" << std::hex
                        << region.ipa << "-0x" << (region.ipa + region.size - 1) << std::dec
                        << ": " << to_string(err) << '\n';
              return false;
            }
        }

      const Stage2Context* context = vms_->findContext(gasid);
      if (not context)
        return false;

      for (unsigned v = 0; v < guest.vcpus; ++v)
        {
          auto vcpu = std::make_unique<Vcpu>(vcpuId, *context, params_.platform);
          unsigned coreIx = vcpuId % params_.cores;
          err = vcpu->init(*regs_.at(coreIx));
          if (err != HvError::None)
            {
              std::cerr << "Error: Failed to initialize vcpu " << vcpuId << ": "
                        << to_string(err) << '\n';
              return false;
            }
          vcpus_.push_back(std::move(vcpu));
          ++vcpuId;
        }
    }

  if (args.verbose)
    std::cerr << "Configured " << guestIds_.size() << " guest(s) with "
              << vcpus_.size() << " vcpu(s)\n";

  return true;
}


bool
Session::runSlice(unsigned coreIx, Vcpu& vcpu, bool trace)
{
  SimCpu& cpu = *cores_.at(coreIx);
  WorldSwitch& ws = *switches_.at(coreIx);

  // Guest arms its timer halfway through the slice.
  uint64_t sliceTicks = usToTicks(params_.sliceUs, params_.platform.counterFrequency);
  VirtualTimer& timer = vcpu.timer();
  HvError err = timer.setTimerTicks(*regs_.at(coreIx), sliceTicks / 2);
  if (err != HvError::None)
    return false;
  timer.start();

  err = ws.armSlice(params_.sliceUs);
  if (err == HvError::None)
    err = ws.restoreAll(vcpu);
  if (err != HvError::None)
    {
      std::cerr << "Error: Failed to enter vcpu " << vcpu.id() << " on core " << coreIx
                << ": " << to_string(err) << '\n';
      return false;
    }

  if (not touchLazyRegions(coreIx, vcpu))
    {
      HvError saveErr = ws.saveAll(vcpu);
      if (saveErr != HvError::None)
        std::cerr << "Error: Failed to leave vcpu " << vcpu.id() << ": "
                  << to_string(saveErr) << '\n';
      return false;
    }

  // Let the slice run out: the guest timer fires first.
  TimerEvent event;
  cpu.advanceCounter(sliceTicks / 2);
  err = ws.dispatchIrq(vcpu.timer().backingIrq(), event);
  if (err == HvError::None)
    {
      cpu.advanceCounter(sliceTicks - sliceTicks / 2);
      err = ws.dispatchIrq(params_.platform.hypTimerIrq, event);
    }

  HvError saveErr = ws.saveAll(vcpu);
  if (err == HvError::None)
    err = saveErr;

  if (err != HvError::None)
    {
      std::cerr << "Error: Failed to run vcpu " << vcpu.id() << " on core " << coreIx
                << ": " << to_string(err) << '\n';
      return false;
    }

  if (trace)
    std::cerr << "core " << coreIx << ": vcpu " << vcpu.id() << " pc 0x" << std::hex
              << vcpu.context().pc() << " pstate 0x" << vcpu.context().pstate()
              << std::dec << '\n';
  return true;
}


bool
Session::touchLazyRegions(unsigned coreIx, Vcpu& vcpu)
{
  SimCpu& cpu = *cores_.at(coreIx);
  WorldSwitch& ws = *switches_.at(coreIx);

  for (unsigned gix = 0; gix < guestIds_.size(); ++gix)
    {
      if (guestIds_.at(gix) != vcpu.gasid())
        continue;

      for (const MemoryRegion& region : params_.guests.at(gix).memory)
        {
          if (not region.lazy)
            continue;

          TranslationResult result;
          if (vms_->translate(vcpu.gasid(), region.ipa, result) == HvError::None)
            continue;  // Already touched by another VCPU.

          // Model the syndrome of a level-3 translation fault on a read.
          EsrFields esr;
          esr.bits_.EC = unsigned(ExceptionClass::DATA_ABORT_LOWER);
          esr.bits_.IL = 1;
          AbortIssFields iss;
          iss.bits_.FSC = 0b000111;
          esr.bits_.ISS = iss.value_;

          HpfarFields hpfar;
          hpfar.bits_.FIPA = region.ipa >> 12;

          cpu.pokeSysReg(SysReg::ESR_EL2, esr.value_);
          cpu.pokeSysReg(SysReg::FAR_EL2, region.ipa & 0xfff);
          cpu.pokeSysReg(SysReg::HPFAR_EL2, hpfar.value_);

          GuestMemoryError error;
          HvError err = ws.handleTrap(vcpu, error);
          if (err != HvError::None)
            {
              std::cerr << "Error: Guest " << error.gasid << " memory error at 0x" << std::hex
                        << error.ipa << std::dec << ": " << to_string(err) << '\n';
              return false;
            }
        }
    }

  return true;
}


bool
Session::translateAddresses(const std::vector<uint64_t>& addrs, std::ostream& out)
{
  bool ok = true;

  for (Gasid gasid : guestIds_)
    for (uint64_t ipa : addrs)
      {
        TranslationResult result;
        HvError err = vms_->translate(gasid, ipa, result);
        out << "guest " << gasid << " ipa 0x" << std::hex << std::setfill('0')
            << std::setw(10) << ipa << std::setfill(' ') << std::dec;
        if (err != HvError::None)
          {
            out << " fault " << to_string(err) << " level " << result.level << '\n';
            ok = false;
            continue;
          }

        out << " -> hpa 0x" << std::hex << std::setfill('0') << std::setw(10)
            << result.hpa << std::setfill(' ') << std::dec << ' '
            << Tlb::blockSizeName(result.level) << ' '
            << (result.attrs.read ? 'r' : '-') << (result.attrs.write ? 'w' : '-')
            << (result.attrs.exec ? 'x' : '-') << ' ' << to_string(result.attrs.type) << '\n';

        if (not tlb_->insertEntry(ipa >> 12, result.hpa >> 12, gasid, result.level,
                                  result.attrs.read, result.attrs.write, result.attrs.exec))
          std::cerr << "Warning: TLB slot busy, translation of 0x" << std::hex << ipa
                    << std::dec << " not cached\n";
      }

  return ok;
}


bool
Session::run(const Args& args)
{
  bool ok = true;

  for (auto& vcpu : vcpus_)
    {
      unsigned coreIx = vcpu->id() % coreCount();
      if (not runSlice(coreIx, *vcpu, args.trace))
        ok = false;
    }

  // An address that does not translate is a result, not a failure.
  if (not args.translateAddrs.empty())
    if (not translateAddresses(args.translateAddrs, std::cout) and args.verbose)
      std::cerr << "Warning: Some addresses did not translate\n";

  if (args.dumpTables)
    {
      vms_->printPageTables(std::cout);
      tlb_->printTlb(std::cout);
      for (auto& vcpu : vcpus_)
        {
          std::cout << "vcpu " << vcpu->id() << " of guest " << vcpu->gasid() << ":\n";
          vcpu->context().print(std::cout, true);
        }
    }

  if (args.verbose)
    std::cerr << "Ran " << vcpus_.size() << " vcpu slice(s): " << injectedCount()
              << " virtual interrupt(s) injected, " << sliceExpiryCount()
              << " slice expiry(ies)\n";

  return ok;
}
