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
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "CpuBackend.hpp"
#include "GasidAllocator.hpp"
#include "PageTableArena.hpp"
#include "Stage2Pte.hpp"
#include "trapEnums.hpp"

namespace ArmHyp
{

  /// Translation granule size (only the 4 KiB granule is supported).
  constexpr uint64_t pageSize = 4096;


  /// Stage-2 translation control: the fields of VTCR_EL2.
  struct Stage2Config
  {
    unsigned t0sz = 16;   // Input address size is 64 - t0sz
    unsigned sl0 = 1;     // Starting level: 0 -> level 2, 1 -> level 1, 2 -> level 0
    unsigned irgn = 1;    // Inner write-back write-allocate
    unsigned orgn = 1;    // Outer write-back write-allocate
    unsigned sh = 3;      // Inner shareable
    unsigned tg = 0;      // 4 KiB granule
    unsigned ps = 2;      // Physical address size: 0 -> 32, 1 -> 40, 2 -> 48 bits

    /// 48-bit input and physical address.
    static Stage2Config default48Bit()
    { return Stage2Config{}; }

    /// 40-bit input and physical address.
    static Stage2Config default40Bit()
    {
      Stage2Config config;
      config.t0sz = 24;
      config.ps = 1;
      return config;
    }

    /// Return the VTCR_EL2 value of this configuration.
    uint64_t encode() const;

    /// Return the configuration held in the given VTCR_EL2 value.
    static Stage2Config decode(uint64_t vtcr);

    /// Return true if this configuration is supported. Otherwise set
    /// message to the reason.
    bool validate(std::string& message) const;

    /// Level of the root table.
    unsigned startLevel() const
    { return sl0 <= 2 ? 2 - sl0 : 0; }

    /// Number of input address bits.
    unsigned inputBits() const
    { return 64 - t0sz; }

    /// Number of input address bits resolved by a walk starting at the
    /// root table. Addresses at or above 2^walkBits() take an address
    /// size fault.
    unsigned walkBits() const;

    /// Exclusive upper bound of walkable guest-physical addresses.
    uint64_t inputLimit() const
    { return uint64_t(1) << walkBits(); }

    /// Number of physical address bits.
    unsigned physAddrBits() const;

    /// Exclusive upper bound of host-physical addresses.
    uint64_t physAddrLimit() const
    { return uint64_t(1) << physAddrBits(); }

    /// Set ps to the field value for the given number of physical address
    /// bits. Return false if not supported.
    static bool psForBits(unsigned bits, unsigned& ps);

    bool operator==(const Stage2Config& other) const = default;
  };


  /// Return the VTTBR_EL2 value tagging the table rooted at the given
  /// host-physical address with the given guest address-space id.
  uint64_t packVttbr(Gasid gasid, uint64_t rootAddr);

  /// Split a VTTBR_EL2 value into its id and root address.
  void unpackVttbr(uint64_t value, Gasid& gasid, uint64_t& rootAddr);


  /// Kind of access checked by a translation.
  enum class AccessType : uint32_t { Read, Write, Execute };


  /// Successful stage-2 translation.
  struct TranslationResult
  {
    uint64_t hpa = 0;        // Host-physical address
    uint64_t blockSize = 0;  // Size of the leaf that mapped the address
    unsigned level = 0;      // Level of the leaf, or faulting level on a fault
    MapAttrs attrs;
  };


  /// Guest-physical region backed on demand: pages are installed when
  /// the guest first touches them.
  struct LazyRegion
  {
    uint64_t ipa = 0;
    uint64_t hpa = 0;
    uint64_t size = 0;
    MapAttrs attrs;

    bool contains(uint64_t addr) const
    { return addr >= ipa and addr - ipa < size; }
  };


  /// Stage-2 translation context of one guest: translation tables
  /// rooted in a table of the shared pool, the translation control and
  /// the bound guest address-space id. Tables are only modified by map
  /// and unmap; callers serialize modifications of a given context.
  class Stage2Context
  {
  public:

    /// Create a context with an empty root table. Return
    /// TableAllocationFailure if the pool is exhausted and
    /// InvalidArgument if the configuration is not supported.
    static HvError create(Gasid gasid, const Stage2Config& config, PageTableArena& arena,
                          CpuBackend& cpu, std::unique_ptr<Stage2Context>& context);

    /// Release every table of this context back to the pool. Does not
    /// invalidate TLBs: see invalidateAll.
    ~Stage2Context();

    Stage2Context(const Stage2Context&) = delete;
    Stage2Context& operator=(const Stage2Context&) = delete;

    Gasid gasid() const
    { return gasid_; }

    const Stage2Config& config() const
    { return config_; }

    /// Host-physical address of the root table.
    uint64_t rootAddress() const
    { return arena_.physAddr(root_); }

    /// Translation root register value of this context.
    uint64_t vttbr() const
    { return packVttbr(gasid_, rootAddress()); }

    /// Map [ipa, ipa+size) to [hpa, hpa+size) using the largest blocks
    /// the alignment allows. The range must not overlap a mapping or a
    /// lazy region. On failure the tables are left unchanged.
    HvError map(uint64_t ipa, uint64_t hpa, uint64_t size, const MapAttrs& attrs);

    /// Remove the mappings of [ipa, ipa+size), splitting partially
    /// covered blocks. Each removed leaf is invalidated in the TLBs by
    /// address and id of this context only. Unmapped parts of the range
    /// are ignored.
    HvError unmap(uint64_t ipa, uint64_t size);

    /// Invalidate every cached translation of this context. Only safe
    /// when no core is translating through this context.
    void invalidateAll();

    /// Walk the tables as the hardware does. On a fault the returned
    /// code classifies it and result.level holds the faulting level.
    HvError translate(uint64_t ipa, TranslationResult& result,
                      AccessType access = AccessType::Read) const;

    /// Return true if every page of [ipa, ipa+size) is mapped.
    bool isRangeMapped(uint64_t ipa, uint64_t size) const;

    /// Register a lazily backed region. The region must not overlap a
    /// mapping or another lazy region.
    HvError addLazyRegion(uint64_t ipa, uint64_t hpa, uint64_t size, const MapAttrs& attrs);

    /// Return the lazy region containing the given address or nullptr.
    const LazyRegion* findLazyRegion(uint64_t ipa) const;

    /// Map the page containing ipa from its lazy region. Return
    /// TranslationFault if ipa is not in a lazy region.
    HvError installLazyPage(uint64_t ipa);

    /// Return the number of tables (root included) used by this context.
    unsigned tableCount() const
    { return tableCount_; }

    /// Print every valid descriptor of this context.
    void printPageTable(std::ostream& out) const;

    /// Print a line per map/unmap/lazy install to the given stream when
    /// flag is true.
    void enableTrace(bool flag, std::ostream* out = nullptr);

  private:

    Stage2Context(Gasid gasid, const Stage2Config& config, PageTableArena& arena,
                  CpuBackend& cpu, uint32_t root);

    /// Size in bytes of the region covered by one entry at the given level.
    static constexpr uint64_t levelSize(unsigned level)
    { return uint64_t(1) << (12 + 9 * (3 - level)); }

    /// Index of the entry covering addr in a table at the given level.
    static constexpr unsigned levelIndex(uint64_t addr, unsigned level)
    { return (addr >> (12 + 9 * (3 - level))) & 511; }

    /// Set index to the pool table referenced by the given table
    /// descriptor. Return false if it is not a table of the pool.
    bool tableIndex(const Stage2Pte& pte, uint32_t& index) const;

    /// Install a single leaf at the given level creating intermediate
    /// tables as needed.
    HvError installLeaf(uint64_t ipa, uint64_t hpa, unsigned level, const MapAttrs& attrs);

    /// Return true if any leaf intersects [start, end) in the subtree of
    /// the given table.
    /// Return true if [ipa, ipa+size) overlaps a lazy region.
    bool overlapsLazyRegion(uint64_t ipa, uint64_t size) const;

    bool rangeHasMapping(uint32_t table, unsigned level, uint64_t tableBase,
                         uint64_t start, uint64_t end) const;

    /// Clear the leaves of [start, end) in the subtree of the given
    /// table freeing tables that become empty.
    HvError removeRange(uint32_t table, unsigned level, uint64_t tableBase,
                        uint64_t start, uint64_t end, bool invalidate);

    /// Release the subtree below the given table (the table excluded).
    void releaseSubtree(uint32_t table, unsigned level);

    void printTable(std::ostream& out, uint32_t table, unsigned level,
                    uint64_t tableBase) const;

    Gasid gasid_ = 0;
    Stage2Config config_;
    PageTableArena& arena_;
    CpuBackend& cpu_;
    uint32_t root_ = 0;
    unsigned tableCount_ = 1;
    std::vector<LazyRegion> lazyRegions_;
    std::ostream* trace_ = nullptr;
  };

}
