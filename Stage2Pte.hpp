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
#include <string_view>

namespace ArmHyp
{

  /// Memory type of a stage-2 mapping.
  enum class MemoryType : uint32_t
    {
      Device,               // Device-nGnRE
      NormalWriteBack,      // Normal, write-back write-allocate
      NormalWriteThrough,   // Normal, write-through
      NormalNonCacheable    // Normal, non-cacheable
    };


  /// Return the name of the given memory type.
  constexpr std::string_view
  to_string(MemoryType type)
  {
    switch (type)
      {
      case MemoryType::Device:             return "device";
      case MemoryType::NormalWriteBack:    return "normal-wb";
      case MemoryType::NormalWriteThrough: return "normal-wt";
      case MemoryType::NormalNonCacheable: return "normal-nc";
      }
    return "?";
  }


  /// Permissions and memory type of a stage-2 mapping.
  struct MapAttrs
  {
    bool read = true;
    bool write = true;
    bool exec = true;
    MemoryType type = MemoryType::NormalWriteBack;

    bool operator==(const MapAttrs& other) const = default;
  };


  /// Structure to unpack the fields of a stage-2 descriptor (4 KiB
  /// granule).
  struct Stage2PteBits
  {
    uint64_t valid_   : 1;
    uint64_t table_   : 1;    // Table descriptor above level 3, page at level 3.
    uint64_t memAttr_ : 4;    // Outer in 3:2, inner in 1:0.
    uint64_t s2ap_    : 2;    // Bit 0 read, bit 1 write.
    uint64_t sh_      : 2;    // Shareability.
    uint64_t af_      : 1;    // Access flag.
    uint64_t res0_    : 1;
    uint64_t addr_    : 36;   // Output address bits 47:12.
    uint64_t res1_    : 4;
    uint64_t contig_  : 1;    // Contiguous hint.
    uint64_t xn_      : 2;    // Execute never.
    uint64_t ign_     : 9;
  } __attribute__((packed));


  /// Stage-2 translation table descriptor.
  union Stage2Pte
  {
    Stage2PteBits bits_;
    uint64_t data_ = 0;

    /// Constructor: Intialize from the the given data value.
    Stage2Pte(uint64_t word = 0) : data_(word)
    { }

    /// Return true if valid bit is on in this descriptor.
    bool valid() const      { return bits_.valid_; }

    /// Return true if this descriptor points to a next-level table
    /// when found at the given level.
    bool isTable(unsigned level) const
    { return valid() and level < 3 and bits_.table_; }

    /// Return true if this descriptor terminates the walk when found
    /// at the given level (block or page).
    bool isLeaf(unsigned level) const
    { return valid() and ((level == 3 and bits_.table_) or (level < 3 and not bits_.table_)); }

    /// Return the output address (next table or mapped region).
    uint64_t address() const  { return uint64_t(bits_.addr_) << 12; }

    bool accessed() const   { return bits_.af_; }
    bool read() const       { return bits_.s2ap_ & 1; }
    bool write() const      { return bits_.s2ap_ & 2; }
    bool exec() const       { return bits_.xn_ == 0; }

    /// Return the memory type encoded in the MemAttr field.
    MemoryType memoryType() const
    {
      switch (bits_.memAttr_)
        {
        case 0xf: return MemoryType::NormalWriteBack;
        case 0xa: return MemoryType::NormalWriteThrough;
        case 0x5: return MemoryType::NormalNonCacheable;
        default:  return MemoryType::Device;
        }
    }

    /// Return the MemAttr field value for the given memory type.
    static constexpr unsigned memAttrFor(MemoryType type)
    {
      switch (type)
        {
        case MemoryType::Device:             return 0x1;
        case MemoryType::NormalWriteBack:    return 0xf;
        case MemoryType::NormalWriteThrough: return 0xa;
        case MemoryType::NormalNonCacheable: return 0x5;
        }
      return 0x1;
    }

    /// Return the attributes carried by this leaf descriptor.
    MapAttrs attrs() const
    { return MapAttrs{read(), write(), exec(), memoryType()}; }

    /// Return a descriptor pointing to the next-level table at the given
    /// host-physical address.
    static Stage2Pte makeTable(uint64_t tableAddr)
    {
      Stage2Pte pte;
      pte.bits_.valid_ = 1;
      pte.bits_.table_ = 1;
      pte.bits_.addr_ = (tableAddr >> 12) & 0xf'ffff'ffffULL;
      return pte;
    }

    /// Return a block (levels 1 and 2) or page (level 3) descriptor
    /// mapping the given host-physical address with the given
    /// attributes. The access flag is set.
    static Stage2Pte makeLeaf(uint64_t outAddr, unsigned level, const MapAttrs& attrs,
                              unsigned shareability)
    {
      Stage2Pte pte;
      pte.bits_.valid_ = 1;
      pte.bits_.table_ = level == 3;
      pte.bits_.memAttr_ = memAttrFor(attrs.type);
      pte.bits_.s2ap_ = (attrs.read ? 1 : 0) | (attrs.write ? 2 : 0);
      pte.bits_.sh_ = attrs.type == MemoryType::Device ? 0 : shareability;
      pte.bits_.af_ = 1;
      pte.bits_.addr_ = (outAddr >> 12) & 0xf'ffff'ffffULL;
      pte.bits_.xn_ = attrs.exec ? 0 : 2;
      return pte;
    }
  };

}
