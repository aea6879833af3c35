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
#include "Stage2.hpp"
#include "SysRegAccess.hpp"

namespace ArmHyp
{

  /// Memory attributes of the hypervisor's own mappings: attr0 device
  /// nGnRnE, attr1 device nGnRE, attr2 normal write-back, attr3 normal
  /// write-through, attr4 normal non-cacheable.
  constexpr uint64_t defaultMair = UINT64_C(0x0000'0044'BBFF'0400);


  /// Choices made once per core when entering hypervisor mode.
  struct El2Options
  {
    Stage2Config stage2;           // Stage-2 translation control
    bool alignmentCheck = false;   // SCTLR_EL2.A
    bool wxn = false;              // SCTLR_EL2.WXN
    uint64_t mair = defaultMair;

    bool operator==(const El2Options& other) const = default;
  };


  /// Configure the calling core for running guests: route lower-level
  /// accesses through stage 2, program the stage-2 translation control,
  /// enable the EL2 caches, trap lower-level FP/SIMD accesses, clear the
  /// implementation-defined register traps, give EL1 access to the
  /// physical counter and zero the virtual counter offset. Return
  /// WrongPrivilegeLevel without touching any register if the core is
  /// not at EL2 and InvalidArgument if the stage-2 configuration is not
  /// supported. Must not run while a guest is active on this core.
  HvError initializeHypervisorMode(SysRegAccess& regs, const El2Options& options = El2Options{});

}
