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

#include <string_view>

#include "RegNamesTemplate.hpp"

namespace ArmHyp
{

  /// Number of general purpose registers (x0 to x30).
  constexpr unsigned intRegCount = 31;

  /// Symbolic names of the general purpose registers.
  enum IntRegNumber
    {
      RegX0 = 0,
      RegX1 = 1,
      RegX2 = 2,
      RegX3 = 3,
      RegX4 = 4,
      RegX5 = 5,
      RegX6 = 6,
      RegX7 = 7,
      RegX8 = 8,
      RegX9 = 9,
      RegX10 = 10,
      RegX11 = 11,
      RegX12 = 12,
      RegX13 = 13,
      RegX14 = 14,
      RegX15 = 15,
      RegX16 = 16,
      RegX17 = 17,
      RegX18 = 18,
      RegX19 = 19,
      RegX20 = 20,
      RegX21 = 21,
      RegX22 = 22,
      RegX23 = 23,
      RegX24 = 24,
      RegX25 = 25,
      RegX26 = 26,
      RegX27 = 27,
      RegX28 = 28,
      RegX29 = 29,
      RegX30 = 30,
      RegXr  = RegX8,   // Indirect result
      RegIp0 = RegX16,  // Intra-procedure-call scratch
      RegIp1 = RegX17,
      RegPr  = RegX18,  // Platform register
      RegFp  = RegX29,  // Frame pointer
      RegLr  = RegX30   // Link register
    };

  constexpr auto _getIntRegNumberToAbiNameArr()
  {
    using namespace std::string_view_literals;

    return std::array{
      "x0"sv,  "x1"sv,  "x2"sv,  "x3"sv,  "x4"sv,  "x5"sv,  "x6"sv,  "x7"sv,
      "xr"sv,  "x9"sv,  "x10"sv, "x11"sv, "x12"sv, "x13"sv, "x14"sv, "x15"sv,
      "ip0"sv, "ip1"sv, "pr"sv,  "x19"sv, "x20"sv, "x21"sv, "x22"sv, "x23"sv,
      "x24"sv, "x25"sv, "x26"sv, "x27"sv, "x28"sv, "fp"sv,  "lr"sv
    };
  }


  /// Manage names of general purpose registers.
  class IntRegNames : public RegNamesTemplate<IntRegNumber,
                                              intRegCount,
                                              'x',
                                              _getIntRegNumberToAbiNameArr> {};

}
