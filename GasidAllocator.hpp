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
#include <atomic>
#include <cstdint>
#include "trapEnums.hpp"

namespace ArmHyp
{

  /// Guest address-space identifier (the VMID tag of stage-2
  /// translations). Valid values are 1 to 255, 0 denotes the host.
  using Gasid = uint32_t;


  /// Lock-free allocator of guest address-space identifiers shared by
  /// all physical cores. Bit n of the bitmap is set when identifier n is
  /// live; bit 0 is never set.
  class GasidAllocator
  {
  public:

    /// Largest identifier.
    static constexpr Gasid maxGasid = 255;

    GasidAllocator();

    GasidAllocator(const GasidAllocator&) = delete;
    GasidAllocator& operator=(const GasidAllocator&) = delete;

    /// Claim a free identifier and set id to it. Return GasidExhausted
    /// if all identifiers are live.
    HvError allocate(Gasid& id);

    /// Release the given identifier. Releasing 0, an out of range or
    /// an already free identifier has no effect.
    void free(Gasid id);

    /// Return true if the given identifier is live.
    bool isAllocated(Gasid id) const;

    /// Return the number of live identifiers.
    unsigned liveCount() const;

    /// Return the number of identifiers that can be live at once.
    static constexpr unsigned capacity()
    { return maxGasid; }

  private:

    /// Try to set the bit of the given identifier. Return true if this
    /// call changed it from clear to set.
    bool tryClaim(Gasid id);

    static constexpr unsigned wordBits = 64;
    static constexpr unsigned wordCount = (maxGasid + 1) / wordBits;

    std::array<std::atomic<uint64_t>, wordCount> words_;
    std::atomic<Gasid> hint_;   // Next identifier to try first.
  };

}
