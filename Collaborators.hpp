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

namespace ArmHyp
{

  class Vcpu;

  /// Virtual interrupt delivery, implemented by the interrupt controller
  /// emulation.
  class InterruptController
  {
  public:

    virtual ~InterruptController() = default;

    /// Make the given interrupt pending for the given VCPU.
    virtual void injectVirtualInterrupt(const Vcpu& vcpu, unsigned irq) = 0;
  };


  /// Callbacks into the VCPU scheduler.
  class SchedulerHooks
  {
  public:

    virtual ~SchedulerHooks() = default;

    /// The execution slice of the VCPU running on the given core (null
    /// if none) has expired.
    virtual void sliceExpired(unsigned coreId, Vcpu* running) = 0;
  };

}
