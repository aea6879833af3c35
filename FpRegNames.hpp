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

  /// Number of SIMD/FP registers (v0 to v31).
  constexpr unsigned fpRegCount = 32;

  /// Symbolic names of the SIMD/FP registers.
  enum FpRegNumber
    {
      RegV0  = 0,
      RegV8  = 8,   // v8 to v15 low halves are callee saved
      RegV15 = 15,
      RegV16 = 16,
      RegV31 = 31
    };

  // The 128-bit views (q0 to q31) serve as alternate names.
  constexpr auto _getFpRegNumberToAbiNameArr()
  {
    return util::make_reg_name_array<fpRegCount, 'q'>::value;
  }


  /// Manage names of SIMD/FP registers.
  class FpRegNames : public RegNamesTemplate<FpRegNumber,
                                             fpRegCount,
                                             'v',
                                             _getFpRegNumberToAbiNameArr> {};

}
