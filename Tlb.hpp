// Copyright 2020 Western Digital Corporation or its affiliates.
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
#include <ostream>
#include <vector>

namespace ArmHyp
{

  /// Cached stage-2 translation.
  struct TlbEntry
  {
    uint64_t ipaPageNum_ = 0;    // Guest-physical page number
    uint64_t hostPageNum_ = 0;   // Host-physical page number
    uint64_t counter_ = 0;       // 2-bit counter for replacement.
    uint32_t vmid_ = 0;          // Virtual machine identifier.
    bool valid_ = false;
    bool read_ = false;          // Has read access.
    bool write_ = false;         // Write access.
    bool exec_ = false;          // Execute Access.
    uint8_t level_ = 3;          // Level of the leaf descriptor (1, 2 or 3).
  };


  /// Model of the stage-2 part of a translation lookaside buffer. Every
  /// entry is tagged with the VMID of the guest whose tables produced
  /// it.
  class Tlb
  {
  public:

    /// Define a a TLB with the given size (number of entries, a power
    /// of 2).
    Tlb(unsigned size);

    /// Return pointer to TLB entry associated with given guest-physical
    /// page number and virtual machine identifier.  Return nullptr if no
    /// such entry.
    TlbEntry* findEntry(uint64_t pageNum, uint32_t vmid)
    {
      auto* entry = getEntry(pageNum, vmid);

      if (entry and entry->valid_ and entry->ipaPageNum_ == pageNum and
          entry->vmid_ == vmid)
        return entry;
      return nullptr;
    }

    /// Same as findEntry but update entry time of access if entry is
    /// found.
    TlbEntry* findEntryUpdateTime(uint64_t pageNum, uint32_t vmid)
    {
      auto* entry = findEntry(pageNum, vmid);
      if (entry)
        {
          ++entry->counter_;
          entry->counter_ &= 3;
        }
      return entry;
    }

    /// Print TLB content
    void printTlb(std::ostream& ost) const;

    /// Print TLB entry
    void printEntry(std::ostream& ost, const TlbEntry& te) const;

    /// Return as a string the block size of a leaf at the given level.
    static constexpr const char* blockSizeName(unsigned level)
    {
      if (level == 3) return "4K";
      if (level == 2) return "2M";
      if (level == 1) return "1G";
      if (level == 0) return "512G";
      return "";
    }

    /// Return the size in units of 4k-bytes of a leaf at the given
    /// level.
    static constexpr uint64_t sizeIn4kBytes(unsigned level)
    {
      if (level > 3)
        return 0;
      return uint64_t(1) << (9 * (3 - level));
    }

    /// Insert a TLB entry for the given translation parameters. If the
    /// slot is taken, its contents are replaced unless it was recently
    /// accessed. Return true on success and false otherwise.
    bool insertEntry(uint64_t ipaPageNum, uint64_t hostPageNum, uint32_t vmid,
                     unsigned level, bool read, bool write, bool exec);

    /// Insert copy of given entry. Return true on success and false otherwise.
    bool insertEntry(const TlbEntry& entry);

    /// Invalidate every entry matching given virtual-machine identifier.
    void invalidateVmid(uint32_t vmid)
    {
      for (auto& entry : entries_)
	if (entry.vmid_ == vmid)
          {
            entry.valid_ = false;
            entry.counter_ = 0;
          }
    }

    /// Invalidate every entry of the given virtual machine identifier
    /// whose block covers the given guest-physical page number.
    void invalidateIpaVmid(uint64_t pageNum, uint32_t vmid)
    {
      for (auto& entry : entries_)
        {
          uint64_t size = sizeIn4kBytes(entry.level_);
          uint64_t base = entry.ipaPageNum_ & ~(size - 1);

          if (base <= pageNum and pageNum < base + size and entry.vmid_ == vmid)
            {
              entry.valid_ = false;
              entry.counter_ = 0;
            }
        }
    }

    /// Invalidate all entries.
    void invalidate()
    {
      for (auto& entry : entries_)
        {
          entry.valid_ = false;
          entry.counter_ = 0;
        }
    }

    /// Return the number of valid entries tagged with the given
    /// virtual machine identifier.
    unsigned validCount(uint32_t vmid) const;

    /// Return the number of entries.
    size_t size() const
    { return entries_.size(); }

  private:

    /// Return reference to TLB entry slot associated with given page
    /// number and virtual machine identifier.
    inline TlbEntry* getEntry(uint64_t pageNum, uint32_t vmid)
    {
      unsigned ix = (pageNum ^ (uint64_t(vmid) << 4)) & (entries_.size() - 1);
      return (entries_.size())? &entries_.at(ix) : nullptr;
    }

    std::vector<TlbEntry> entries_;
  };
}
