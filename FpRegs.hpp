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
#include <cstddef>
#include <vector>
#include "FpRegNames.hpp"

namespace ArmHyp
{

  /// Value of a 128-bit SIMD/FP register.
  struct VecReg
  {
    uint64_t lo = 0;
    uint64_t hi = 0;

    bool operator==(const VecReg& other) const = default;
  };


  /// Model an AArch64 SIMD/FP register file: 32 128-bit vector
  /// registers together with the FPCR and FPSR control/status
  /// registers.
  class FpRegs
  {
  public:

    /// Constructor: Define a register file with the given number of
    /// registers. All registers initialized to zero.
    FpRegs(unsigned registerCount = fpRegCount);

    /// Return value of ith register.
    const VecReg& read(unsigned i) const
    { return regs_.at(i); }

    /// Set value of ith register.
    void write(unsigned i, const VecReg& value)
    { regs_.at(i) = value; }

    /// Return the low 64 bits (the d register view) of the ith register.
    uint64_t readDouble(unsigned i) const
    { return regs_.at(i).lo; }

    /// Set the low 64 bits of the ith register clearing the upper half
    /// as a scalar write does.
    void writeDouble(unsigned i, uint64_t value)
    { regs_.at(i) = VecReg{value, 0}; }

    uint64_t fpcr() const
    { return fpcr_; }

    void setFpcr(uint64_t value)
    { fpcr_ = value; }

    uint64_t fpsr() const
    { return fpsr_; }

    void setFpsr(uint64_t value)
    { fpsr_ = value; }

    /// Return the count of registers in this register file.
    size_t size() const
    { return regs_.size(); }

    /// Set ix to the number of the register corresponding to the
    /// given name (e.g. "v3" or "q3") returning true on success and
    /// false if no such register.
    bool findReg(std::string_view name, unsigned& ix) const;

    /// Return the name of the given register.
    static constexpr std::string_view regName(unsigned i, bool abiNames = false)
    { return FpRegNames::regName(i, abiNames); }

    /// Clear all registers and the control/status registers.
    void reset();

    bool operator==(const FpRegs& other) const = default;

  private:

    std::vector<VecReg> regs_;
    uint64_t fpcr_ = 0;
    uint64_t fpsr_ = 0;
  };
}
