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
#include "SysRegs.hpp"
#include "FpRegs.hpp"

namespace ArmHyp
{

  /// Raw access to the registers and maintenance operations of one
  /// physical core. Methods perform no checking whatsoever: callers go
  /// through SysRegAccess which enforces privilege and interrupt-mask
  /// preconditions.
  class CpuBackend
  {
  public:

    virtual ~CpuBackend() = default;

    /// Identifier of the physical core.
    virtual unsigned coreId() const = 0;

    virtual uint64_t readSysReg(SysReg reg) = 0;

    virtual void writeSysReg(SysReg reg, uint64_t value) = 0;

    /// Read general purpose register ix (0 to 30) of the trapped
    /// context.
    virtual uint64_t readGpr(unsigned ix) = 0;

    virtual void writeGpr(unsigned ix, uint64_t value) = 0;

    /// Read SIMD/FP register ix (0 to 31).
    virtual VecReg readVecReg(unsigned ix) = 0;

    virtual void writeVecReg(unsigned ix, const VecReg& value) = 0;

    /// Instruction synchronization barrier.
    virtual void instructionBarrier() = 0;

    /// Inner-shareable data synchronization barrier.
    virtual void dataBarrier() = 0;

    /// Invalidate cached stage-2 translations of the given IPA tagged
    /// with the given VMID in the inner-shareable domain.
    virtual void tlbInvalidateIpa(uint32_t vmid, uint64_t ipa) = 0;

    /// Invalidate all cached translations tagged with the given VMID.
    virtual void tlbInvalidateVmid(uint32_t vmid) = 0;

    /// Invalidate all stage-1 and stage-2 translations of every VMID.
    virtual void tlbInvalidateAll() = 0;
  };

}
