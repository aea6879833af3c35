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

#include <algorithm>
#include "PageTableArena.hpp"

using namespace ArmHyp;


PageTableArena::PageTableArena(uint64_t base, unsigned count)
  : base_(base & ~(tableBytes - 1)), tables_(count), inUse_(count, false)
{
  // Hand out low indices first.
  freeList_.reserve(count);
  for (unsigned i = count; i > 0; --i)
    freeList_.push_back(i - 1);
}


bool
PageTableArena::allocate(uint32_t& index)
{
  if (freeList_.empty())
    return false;

  index = freeList_.back();
  freeList_.pop_back();
  inUse_.at(index) = true;
  tables_.at(index).fill(0);
  return true;
}


void
PageTableArena::release(uint32_t index)
{
  if (not isAllocated(index))
    return;
  inUse_.at(index) = false;
  freeList_.push_back(index);
}


bool
PageTableArena::indexOf(uint64_t addr, uint32_t& index) const
{
  if (addr < base_ or (addr & (tableBytes - 1)) != 0)
    return false;
  uint64_t ix = (addr - base_) / tableBytes;
  if (ix >= tables_.size())
    return false;
  index = uint32_t(ix);
  return true;
}


bool
PageTableArena::isEmpty(uint32_t index) const
{
  const auto& tab = tables_.at(index);
  return std::none_of(tab.begin(), tab.end(), [](uint64_t pte) { return pte & 1; });
}
