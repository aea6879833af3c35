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
#include <iterator>
#include <unordered_map>

#include "util.hpp"

namespace ArmHyp
{

  /// Name/number lookup for a register file whose registers are named
  /// with a single prefix character followed by the register number
  /// (x0, v17, ...) and which may also have an alternate (ABI) name
  /// per register.
  template <typename RegNumberEnum,
            std::size_t NUM_REGS,
            char PREFIX_CHAR,
            std::array<std::string_view, NUM_REGS>(*GET_NUMBER_TO_ABI_NAME)()>
  class RegNamesTemplate
  {
  public:
    RegNamesTemplate() = delete;

    /// Set ix to the number of the register corresponding to the
    /// given name returning true on success and false if no such
    /// register.  For example, if name is "x29" or "fp" then ix will
    /// be set to 29.
    [[nodiscard]] static bool findReg(std::string_view name, unsigned& ix)
    {
      const auto iter = nameToNumber_.find(name);
      if (iter == nameToNumber_.end())
        return false;
      ix = iter->second;
      return true;
    }

    /// Return the name of the given register.
    static constexpr std::string_view regName(unsigned i, bool abiNames = false)
    {
      const auto& names = abiNames ? numberToAbiName_ : numberToName_;
      if (i < names.size())
        return names[i];
      return unknown_;
    }

  private:

    static std::unordered_map<std::string_view, RegNumberEnum> buildNameToNumberMap()
    {
      std::unordered_map<std::string_view, RegNumberEnum> result;

      for (unsigned ix = 0; ix < NUM_REGS; ++ix)
        {
          result[numberToName_.at(ix)] = RegNumberEnum(ix);
          result[numberToAbiName_.at(ix)] = RegNumberEnum(ix);
        }

      return result;
    }

    static inline constexpr auto unknown_arr_     = std::to_array<char>({PREFIX_CHAR, '?', 0});
    static inline constexpr auto unknown_         = std::string_view(unknown_arr_.begin(), std::prev(unknown_arr_.end()));
    static inline constexpr auto numberToName_    = util::make_reg_name_array<NUM_REGS, PREFIX_CHAR>::value;
    static inline constexpr auto numberToAbiName_ = GET_NUMBER_TO_ABI_NAME();
    static inline const     auto nameToNumber_    = buildNameToNumberMap();
  };

}
