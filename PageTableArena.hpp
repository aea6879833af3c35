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
#include <vector>

namespace ArmHyp
{

  /// Fixed pool of 4 KiB translation tables. A table is named by its
  /// index in the pool; its host-physical address, which is what
  /// descriptors and translation root registers carry, is
  /// base + index * 4096.
  class PageTableArena
  {
  public:

    static constexpr unsigned entriesPerTable = 512;
    static constexpr uint64_t tableBytes = 4096;

    using Table = std::array<uint64_t, entriesPerTable>;

    /// Define a pool of count tables whose first table sits at the
    /// given host-physical address (4 KiB aligned).
    PageTableArena(uint64_t base, unsigned count);

    /// Claim a zeroed table and set index to it. Return false if the
    /// pool is exhausted.
    [[nodiscard]] bool allocate(uint32_t& index);

    /// Return the given table to the pool.
    void release(uint32_t index);

    /// Return the host-physical address of the given table.
    uint64_t physAddr(uint32_t index) const
    { return base_ + uint64_t(index) * tableBytes; }

    /// Set index to the table at the given host-physical address.
    /// Return false if the address is not that of a table of this pool.
    bool indexOf(uint64_t addr, uint32_t& index) const;

    Table& table(uint32_t index)
    { return tables_.at(index); }

    const Table& table(uint32_t index) const
    { return tables_.at(index); }

    /// Return true if no entry of the given table is valid.
    bool isEmpty(uint32_t index) const;

    bool isAllocated(uint32_t index) const
    { return index < inUse_.size() and inUse_.at(index); }

    unsigned capacity() const
    { return unsigned(tables_.size()); }

    unsigned freeCount() const
    { return unsigned(freeList_.size()); }

    uint64_t base() const
    { return base_; }

  private:

    uint64_t base_ = 0;
    std::vector<Table> tables_;
    std::vector<bool> inUse_;
    std::vector<uint32_t> freeList_;
  };

}
