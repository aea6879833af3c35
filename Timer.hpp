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

#pragma once

#include <cstdint>
#include "SysRegAccess.hpp"
#include "trapEnums.hpp"

namespace ArmHyp
{

  /// Counter values live in a 56-bit space.
  constexpr uint64_t counterMask = UINT64_C(0x00FF'FFFF'FFFF'FFFF);

  /// Half of the counter space. A compare value is considered reached
  /// when the counter is at most this far past it.
  constexpr uint64_t counterHalfRange = uint64_t(1) << 55;

  /// Platform defaults used when no platform description overrides them.
  constexpr uint64_t defaultCounterFrequency = 62'500'000;
  constexpr unsigned defaultVirtualTimerIrq  = 27;
  constexpr unsigned defaultHypTimerIrq      = 26;
  constexpr unsigned defaultPhysTimerIrq     = 30;


  /// Return a + b in the 56-bit counter space.
  constexpr uint64_t counterAdd(uint64_t a, uint64_t b)
  { return (a + b) & counterMask; }

  /// Return a - b in the 56-bit counter space.
  constexpr uint64_t counterSub(uint64_t a, uint64_t b)
  { return (a - b) & counterMask; }

  /// Return true if counter value now has reached or passed cval taking
  /// wraparound of the 56-bit space into account.
  constexpr bool counterReached(uint64_t now, uint64_t cval)
  { return counterSub(now, cval) < counterHalfRange; }

  /// Convert counter ticks to nanoseconds. Return 0 if freq is 0.
  uint64_t ticksToNs(uint64_t ticks, uint64_t freq);

  /// Convert nanoseconds to counter ticks. Return 0 if freq is 0.
  uint64_t nsToTicks(uint64_t ns, uint64_t freq);

  /// Convert microseconds to counter ticks. Return 0 if freq is 0.
  uint64_t usToTicks(uint64_t us, uint64_t freq);


  /// Counter frequency and timer interrupt lines of the platform, as
  /// supplied by the platform description.
  struct PlatformInfo
  {
    uint64_t counterFrequency = defaultCounterFrequency;
    unsigned virtualTimerIrq = defaultVirtualTimerIrq;  // Injected into guests
    unsigned hypTimerIrq = defaultHypTimerIrq;          // Hypervisor slice timer
    unsigned physTimerIrq = defaultPhysTimerIrq;        // Backs the virtual timer
  };


  /// Outcome of a timer interrupt, consumed by the caller.
  struct TimerEvent
  {
    enum class Kind : uint32_t
      {
        None,              // Not expired, nothing to do
        InjectVirtualIrq,  // Deliver irq to the owning guest
        SliceExpired       // Hand control back to the scheduler
      };

    Kind kind = Kind::None;
    unsigned irq = 0;
  };


  /// Guest-visible virtual timer of one VCPU. The guest sees the
  /// physical counter minus a per-guest offset fixed at creation. The
  /// state is held here while the VCPU is descheduled and is moved to
  /// and from the CNTV registers by save/restore.
  ///
  /// Arming with setTimerTicks or setTimerCval replaces any previously
  /// armed compare value: the most recent call is authoritative.
  class VirtualTimer
  {
  public:

    VirtualTimer(unsigned virtualIrq = defaultVirtualTimerIrq,
                 unsigned backingIrq = defaultPhysTimerIrq)
      : virtualIrq_(virtualIrq), backingIrq_(backingIrq)
    { }

    /// Fix the offset of this timer. May be called once: a second call
    /// fails with InvalidArgument.
    HvError init(uint64_t offset);

    bool isInitialized() const
    { return initialized_; }

    uint64_t offset() const
    { return offset_; }

    /// Set value to the guest-visible counter: physical counter minus
    /// offset modulo 2^56.
    HvError readVirtualCounter(const SysRegAccess& regs, uint64_t& value) const;

    /// Arm the timer to expire ticks after the current virtual counter.
    HvError setTimerTicks(const SysRegAccess& regs, uint64_t ticks);

    /// Arm the timer to expire when the virtual counter reaches cval.
    HvError setTimerCval(uint64_t cval);

    /// Set expired to true if the virtual counter has reached the
    /// compare value.
    HvError hasExpired(const SysRegAccess& regs, bool& expired) const;

    /// Set ticks to the number of ticks left before expiry (0 if
    /// expired).
    HvError remainingTicks(const SysRegAccess& regs, uint64_t& ticks) const;

    /// Handle the physical interrupt backing this timer. If the timer
    /// expired, stop it and set event to inject the virtual interrupt.
    /// The timer is one-shot: re-arming is up to the guest.
    HvError handlePhysIrq(const SysRegAccess& regs, TimerEvent& event);

    /// Capture control, compare value and offset from the hardware.
    HvError save(const SysRegAccess& regs);

    /// Program offset, compare value and control into the hardware.
    HvError restore(SysRegAccess& regs) const;

    /// Enable and unmask.
    void start();

    /// Disable and mask.
    void stop();

    /// Clear control and compare value keeping the offset.
    void reset()
    { ctl_ = 0; cval_ = 0; }

    bool isEnabled() const;
    bool isMasked() const;
    bool isPending() const;

    uint64_t ctl() const
    { return ctl_; }

    uint64_t cval() const
    { return cval_; }

    unsigned virtualIrq() const
    { return virtualIrq_; }

    unsigned backingIrq() const
    { return backingIrq_; }

  private:

    uint64_t ctl_ = 0;
    uint64_t cval_ = 0;
    uint64_t offset_ = 0;
    bool initialized_ = false;
    unsigned virtualIrq_ = defaultVirtualTimerIrq;
    unsigned backingIrq_ = defaultPhysTimerIrq;
  };


  /// Per physical core timer bounding the execution slice of the
  /// running VCPU. Never visible to guests.
  class HypervisorTimer
  {
  public:

    HypervisorTimer(unsigned irq = defaultHypTimerIrq)
      : irq_(irq)
    { }

    /// Arm the timer to fire ticks after the current physical counter
    /// and program it into the hardware.
    HvError armSlice(SysRegAccess& regs, uint64_t ticks);

    /// Disable the timer in the hardware.
    HvError cancel(SysRegAccess& regs);

    /// Set expired to true if the physical counter reached the compare
    /// value.
    HvError hasExpired(const SysRegAccess& regs, bool& expired) const;

    /// Set ticks to the number of ticks left in the slice (0 if
    /// expired).
    HvError remainingTicks(const SysRegAccess& regs, uint64_t& ticks) const;

    /// Handle the timer interrupt: if expired, mask and disable the
    /// timer and set event to SliceExpired.
    HvError handleIrq(SysRegAccess& regs, TimerEvent& event);

    /// Capture control and compare value from the hardware.
    HvError save(const SysRegAccess& regs);

    /// Program compare value and control into the hardware.
    HvError restore(SysRegAccess& regs) const;

    void start();
    void stop();

    bool isEnabled() const;
    bool isMasked() const;
    bool isPending() const;

    uint64_t ctl() const
    { return ctl_; }

    uint64_t cval() const
    { return cval_; }

    unsigned irq() const
    { return irq_; }

  private:

    uint64_t ctl_ = 0;
    uint64_t cval_ = 0;
    unsigned irq_ = defaultHypTimerIrq;
  };

}
