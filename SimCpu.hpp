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

#include <array>
#include <cstdint>
#include <memory>
#include "CpuBackend.hpp"
#include "Tlb.hpp"

namespace ArmHyp
{

  /// Host-side model of one physical core: register file, free-running
  /// counter and the stage-2 TLB that the maintenance operations act
  /// on. Cores of one simulated system may share a TLB to model the
  /// inner-shareable broadcast of TLB maintenance.
  class SimCpu : public CpuBackend
  {
  public:

    /// Default number of TLB entries of a private TLB.
    static constexpr unsigned defaultTlbSize = 256;

    /// Define a core running at EL2 with all registers zero. If tlb is
    /// null, the core gets a private TLB.
    SimCpu(unsigned coreId = 0, std::shared_ptr<Tlb> tlb = nullptr);

    unsigned coreId() const override
    { return coreId_; }

    uint64_t readSysReg(SysReg reg) override;

    void writeSysReg(SysReg reg, uint64_t value) override;

    uint64_t readGpr(unsigned ix) override
    { return gprs_.at(ix); }

    void writeGpr(unsigned ix, uint64_t value) override
    { ++writeCount_; gprs_.at(ix) = value; }

    VecReg readVecReg(unsigned ix) override
    { ++vecReadCount_; return vecRegs_.at(ix); }

    void writeVecReg(unsigned ix, const VecReg& value) override
    { ++writeCount_; ++vecWriteCount_; vecRegs_.at(ix) = value; }

    void instructionBarrier() override
    { ++barrierCount_; }

    void dataBarrier() override
    { ++barrierCount_; }

    void tlbInvalidateIpa(uint32_t vmid, uint64_t ipa) override;

    void tlbInvalidateVmid(uint32_t vmid) override;

    void tlbInvalidateAll() override;

    /// Change the exception level the core runs at.
    void setPrivilegeLevel(PrivilegeLevel level)
    { level_ = level; }

    /// Set the physical counter.
    void setCounter(uint64_t value)
    { counter_ = value; }

    /// Advance the physical counter by the given number of ticks.
    void advanceCounter(uint64_t ticks)
    { counter_ += ticks; }

    uint64_t counter() const
    { return counter_; }

    /// Set a register without counting it as a write. Used to model
    /// state produced by hardware (syndrome registers, trap frames).
    void pokeSysReg(SysReg reg, uint64_t value)
    { sysRegs_.at(static_cast<unsigned>(reg)) = value; }

    /// Same as pokeSysReg for general purpose registers.
    void pokeGpr(unsigned ix, uint64_t value)
    { gprs_.at(ix) = value; }

    /// Same as pokeSysReg for SIMD/FP registers.
    void pokeVecReg(unsigned ix, const VecReg& value)
    { vecRegs_.at(ix) = value; }

    /// Return the number of register writes since construction or the
    /// last clearCounts.
    uint64_t writeCount() const
    { return writeCount_; }

    /// Return the number of SIMD/FP register writes.
    uint64_t vecWriteCount() const
    { return vecWriteCount_; }

    /// Return the number of SIMD/FP register reads.
    uint64_t vecReadCount() const
    { return vecReadCount_; }

    uint64_t barrierCount() const
    { return barrierCount_; }

    /// Return the number of TLB maintenance operations.
    uint64_t tlbiCount() const
    { return tlbiCount_; }

    void clearCounts()
    { writeCount_ = vecWriteCount_ = vecReadCount_ = barrierCount_ = tlbiCount_ = 0; }

    Tlb& tlb()
    { return *tlb_; }

    const std::shared_ptr<Tlb>& sharedTlb() const
    { return tlb_; }

  private:

    unsigned coreId_ = 0;
    PrivilegeLevel level_ = PrivilegeLevel::El2;
    uint64_t counter_ = 0;

    std::array<uint64_t, sysRegCount> sysRegs_{};
    std::array<uint64_t, 31> gprs_{};
    std::array<VecReg, 32> vecRegs_{};
    std::shared_ptr<Tlb> tlb_;

    uint64_t writeCount_ = 0;
    uint64_t vecWriteCount_ = 0;
    uint64_t vecReadCount_ = 0;
    uint64_t barrierCount_ = 0;
    uint64_t tlbiCount_ = 0;
  };

}
