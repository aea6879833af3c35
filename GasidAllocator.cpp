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

#include <bit>
#include "GasidAllocator.hpp"

using namespace ArmHyp;


GasidAllocator::GasidAllocator()
  : hint_(1)
{
  for (auto& word : words_)
    word.store(0, std::memory_order_relaxed);
}


bool
GasidAllocator::tryClaim(Gasid id)
{
  uint64_t mask = uint64_t(1) << (id % wordBits);
  uint64_t prev = words_.at(id / wordBits).fetch_or(mask, std::memory_order_acquire);
  return (prev & mask) == 0;
}


HvError
GasidAllocator::allocate(Gasid& id)
{
  // Fast path: the identifier following the last one handed out.
  Gasid hint = hint_.load(std::memory_order_relaxed);
  if (hint >= 1 and hint <= maxGasid and tryClaim(hint))
    {
      hint_.store(hint == maxGasid ? 1 : hint + 1, std::memory_order_relaxed);
      id = hint;
      return HvError::None;
    }

  // Linear scan for a clear bit. A bit seen clear may be claimed by
  // another core before the fetch_or, in which case keep scanning.
  for (unsigned w = 0; w < wordCount; ++w)
    {
      uint64_t avail = ~words_.at(w).load(std::memory_order_relaxed);
      if (w == 0)
        avail &= ~uint64_t(1);  // Identifier 0 is reserved.

      while (avail)
        {
          Gasid cand = w * wordBits + std::countr_zero(avail);
          if (tryClaim(cand))
            {
              hint_.store(cand == maxGasid ? 1 : cand + 1, std::memory_order_relaxed);
              id = cand;
              return HvError::None;
            }
          avail &= avail - 1;
        }
    }

  return HvError::GasidExhausted;
}


void
GasidAllocator::free(Gasid id)
{
  if (id == 0 or id > maxGasid)
    return;
  uint64_t mask = uint64_t(1) << (id % wordBits);
  words_.at(id / wordBits).fetch_and(~mask, std::memory_order_release);
}


bool
GasidAllocator::isAllocated(Gasid id) const
{
  if (id == 0 or id > maxGasid)
    return false;
  uint64_t mask = uint64_t(1) << (id % wordBits);
  return (words_.at(id / wordBits).load(std::memory_order_acquire) & mask) != 0;
}


unsigned
GasidAllocator::liveCount() const
{
  unsigned count = 0;
  for (const auto& word : words_)
    count += std::popcount(word.load(std::memory_order_relaxed));
  return count;
}
