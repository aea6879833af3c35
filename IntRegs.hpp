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
#include "IntRegNames.hpp"


namespace ArmHyp
{

  /// Model an AArch64 general purpose register file (x0 to x30). The
  /// stack pointer and the zero register are not part of this file.
  class IntRegs
  {
  public:

    /// Constructor: Define a register file with the given number of
    /// registers. All registers initialized to zero.
    IntRegs(unsigned registerCount = intRegCount);

    /// Return value of ith register.
    uint64_t read(unsigned i) const
    { return regs_.at(i); }

    /// Set value of ith register to the given value.
    void write(unsigned i, uint64_t value)
    { regs_.at(i) = value; }

    /// Return the count of registers in this register file.
    size_t size() const
    { return regs_.size(); }

    /// Set ix to the number of the register corresponding to the
    /// given name returning true on success and false if no such
    /// register.  For example, if name is "x30" or "lr" then ix will
    /// be set to 30.
    bool findReg(std::string_view name, unsigned& ix) const;

    /// Return the name of the given register.
    static constexpr std::string_view regName(unsigned i, bool abiNames = false)
    { return IntRegNames::regName(i, abiNames); }

    /// Clear all regisers.
    void reset()
    {
      for (auto& reg : regs_)
	reg = 0;
    }

    bool operator==(const IntRegs& other) const = default;

  private:

    std::vector<uint64_t> regs_;
  };
}
