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
#include "CpuBackend.hpp"

namespace ArmHyp
{

  /// Backend running on the physical core itself: system registers are
  /// accessed with mrs/msr and maintenance is done with the tlbi, isb
  /// and dsb instructions. Only built for aarch64 targets. General
  /// purpose registers of the trapped context live in the trap frame
  /// written by the exception vectors.
  class Aarch64Cpu : public CpuBackend
  {
  public:

    explicit Aarch64Cpu(unsigned coreId)
      : coreId_(coreId)
    { }

    unsigned coreId() const override
    { return coreId_; }

    uint64_t readSysReg(SysReg reg) override;

    void writeSysReg(SysReg reg, uint64_t value) override;

    uint64_t readGpr(unsigned ix) override;

    void writeGpr(unsigned ix, uint64_t value) override;

    VecReg readVecReg(unsigned ix) override;

    void writeVecReg(unsigned ix, const VecReg& value) override;

    void instructionBarrier() override;

    void dataBarrier() override;

    void tlbInvalidateIpa(uint32_t vmid, uint64_t ipa) override;

    void tlbInvalidateVmid(uint32_t vmid) override;

    void tlbInvalidateAll() override;

    /// Define the trap frame (x0 to x30) saved by the exception vector
    /// of the current trap. Must be set before readGpr/writeGpr.
    void setTrapFrame(uint64_t* frame)
    { frame_ = frame; }

  private:

    /// Run fn with VTTBR_EL2.VMID temporarily set to vmid: stage-2
    /// maintenance by address applies to the current VMID.
    template <typename FN>
    void withVmid(uint32_t vmid, FN fn);

    unsigned coreId_ = 0;
    uint64_t* frame_ = nullptr;
  };

}
