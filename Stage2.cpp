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
#include <iomanip>
#include <iostream>
#include <string>
#include "Stage2.hpp"
#include "SysRegFields.hpp"
#include "util.hpp"

using namespace ArmHyp;


uint64_t
Stage2Config::encode() const
{
  VtcrFields vtcr;
  vtcr.bits_.T0SZ = t0sz;
  vtcr.bits_.SL0 = sl0;
  vtcr.bits_.IRGN0 = irgn;
  vtcr.bits_.ORGN0 = orgn;
  vtcr.bits_.SH0 = sh;
  vtcr.bits_.TG0 = tg;
  vtcr.bits_.PS = ps;
  return vtcr.value_;
}


Stage2Config
Stage2Config::decode(uint64_t value)
{
  VtcrFields vtcr(value);
  Stage2Config config;
  config.t0sz = vtcr.bits_.T0SZ;
  config.sl0 = vtcr.bits_.SL0;
  config.irgn = vtcr.bits_.IRGN0;
  config.orgn = vtcr.bits_.ORGN0;
  config.sh = vtcr.bits_.SH0;
  config.tg = vtcr.bits_.TG0;
  config.ps = vtcr.bits_.PS;
  return config;
}


bool
Stage2Config::validate(std::string& message) const
{
  if (tg != 0)
    message = "only the 4k granule (tg=0) is supported";
  else if (sl0 > 2)
    message = "starting level field must be 0, 1 or 2";
  else if (t0sz < 16 or t0sz > 39)
    message = "t0sz must be between 16 and 39";
  else if (ps > 2)
    message = "physical address size field must be 0, 1 or 2";
  else if (irgn > 3 or orgn > 3 or sh > 3)
    message = "cacheability and shareability fields are 2 bits wide";
  else
    return true;
  return false;
}


unsigned
Stage2Config::walkBits() const
{
  unsigned levels = 4 - startLevel();
  return std::min(inputBits(), 12 + 9 * levels);
}


unsigned
Stage2Config::physAddrBits() const
{
  switch (ps)
    {
    case 0:  return 32;
    case 1:  return 40;
    default: return 48;
    }
}


bool
Stage2Config::psForBits(unsigned bits, unsigned& ps)
{
  switch (bits)
    {
    case 32: ps = 0; return true;
    case 40: ps = 1; return true;
    case 48: ps = 2; return true;
    default: return false;
    }
}


uint64_t
ArmHyp::packVttbr(Gasid gasid, uint64_t rootAddr)
{
  VttbrFields vttbr;
  vttbr.bits_.BADDR = (rootAddr >> 12) & 0xf'ffff'ffffULL;
  vttbr.bits_.VMID = gasid & 0xff;
  return vttbr.value_;
}


void
ArmHyp::unpackVttbr(uint64_t value, Gasid& gasid, uint64_t& rootAddr)
{
  VttbrFields vttbr(value);
  gasid = vttbr.bits_.VMID;
  rootAddr = uint64_t(vttbr.bits_.BADDR) << 12;
}


HvError
Stage2Context::create(Gasid gasid, const Stage2Config& config, PageTableArena& arena,
                      CpuBackend& cpu, std::unique_ptr<Stage2Context>& context)
{
  std::string message;
  if (not config.validate(message))
    {
      std::cerr << "Error: Invalid stage-2 configuration: " << message << '\n';
      return HvError::InvalidArgument;
    }

  uint32_t root = 0;
  if (not arena.allocate(root))
    return HvError::TableAllocationFailure;

  context.reset(new Stage2Context(gasid, config, arena, cpu, root));
  return HvError::None;
}


Stage2Context::Stage2Context(Gasid gasid, const Stage2Config& config,
                             PageTableArena& arena, CpuBackend& cpu, uint32_t root)
  : gasid_(gasid), config_(config), arena_(arena), cpu_(cpu), root_(root)
{
}


Stage2Context::~Stage2Context()
{
  releaseSubtree(root_, config_.startLevel());
  arena_.release(root_);
}


void
Stage2Context::enableTrace(bool flag, std::ostream* out)
{
  trace_ = flag ? (out ? out : &std::cerr) : nullptr;
}


bool
Stage2Context::tableIndex(const Stage2Pte& pte, uint32_t& index) const
{
  return arena_.indexOf(pte.address(), index) and arena_.isAllocated(index);
}


HvError
Stage2Context::map(uint64_t ipa, uint64_t hpa, uint64_t size, const MapAttrs& attrs)
{
  if (size == 0)
    return HvError::InvalidArgument;

  if (not util::isAligned(ipa | hpa | size, pageSize))
    return HvError::UnalignedAddress;

  uint64_t ipaLimit = config_.inputLimit();
  uint64_t paLimit = config_.physAddrLimit();
  if (size > ipaLimit or ipa > ipaLimit - size or size > paLimit or hpa > paLimit - size)
    return HvError::AddressSizeFault;

  if (overlapsLazyRegion(ipa, size) or
      rangeHasMapping(root_, config_.startLevel(), 0, ipa, ipa + size))
    return HvError::OverlappingMapping;

  unsigned minBlockLevel = std::max(config_.startLevel(), 1u);

  uint64_t done = 0;
  while (done < size)
    {
      uint64_t curIpa = ipa + done, curHpa = hpa + done, left = size - done;

      // Largest block the alignment and remaining size allow.
      unsigned level = 3;
      for (unsigned l = minBlockLevel; l < 3; ++l)
        {
          uint64_t bs = levelSize(l);
          if (util::isAligned(curIpa | curHpa, bs) and left >= bs)
            {
              level = l;
              break;
            }
        }

      HvError err = installLeaf(curIpa, curHpa, level, attrs);
      if (err != HvError::None)
        {
          // Undo the part installed so far, including the tables of the
          // failed leaf. The range was unmapped on entry, so this frees
          // every table created here.
          uint64_t undoEnd = curIpa + levelSize(level);
          HvError undo = removeRange(root_, config_.startLevel(), 0, ipa, undoEnd, false);
          if (undo != HvError::None)
            std::cerr << "Error: Failed to roll back partial stage-2 mapping of vmid "
                      << gasid_ << ": " << to_string(undo) << '\n';
          return err;
        }
      done += levelSize(level);
    }

  cpu_.dataBarrier();

  if (trace_)
    *trace_ << "stage2: vmid " << gasid_ << " map 0x" << std::hex << ipa << "-0x"
            << (ipa + size - 1) << " -> 0x" << hpa << std::dec << ' '
            << (attrs.read ? 'r' : '-') << (attrs.write ? 'w' : '-')
            << (attrs.exec ? 'x' : '-') << ' ' << to_string(attrs.type) << '\n';

  return HvError::None;
}


HvError
Stage2Context::installLeaf(uint64_t ipa, uint64_t hpa, unsigned targetLevel,
                           const MapAttrs& attrs)
{
  uint32_t tab = root_;

  for (unsigned level = config_.startLevel(); level < targetLevel; ++level)
    {
      auto& entries = arena_.table(tab);
      unsigned ix = levelIndex(ipa, level);
      Stage2Pte pte(entries.at(ix));

      if (not pte.valid())
        {
          uint32_t child = 0;
          if (not arena_.allocate(child))
            return HvError::TableAllocationFailure;
          ++tableCount_;
          entries.at(ix) = Stage2Pte::makeTable(arena_.physAddr(child)).data_;
          tab = child;
          continue;
        }

      if (not pte.isTable(level) or not tableIndex(pte, tab))
        return HvError::OverlappingMapping;
    }

  auto& entries = arena_.table(tab);
  unsigned ix = levelIndex(ipa, targetLevel);
  if (Stage2Pte(entries.at(ix)).valid())
    return HvError::OverlappingMapping;
  entries.at(ix) = Stage2Pte::makeLeaf(hpa, targetLevel, attrs, config_.sh).data_;
  return HvError::None;
}


bool
Stage2Context::rangeHasMapping(uint32_t tab, unsigned level, uint64_t tableBase,
                               uint64_t start, uint64_t end) const
{
  const auto& entries = arena_.table(tab);
  uint64_t size = levelSize(level);

  for (unsigned i = levelIndex(start, level); i < PageTableArena::entriesPerTable; ++i)
    {
      uint64_t entryBase = tableBase + i * size;
      if (entryBase >= end)
        break;

      Stage2Pte pte(entries.at(i));
      if (not pte.valid())
        continue;

      uint32_t child = 0;
      if (pte.isTable(level) and tableIndex(pte, child))
        {
          uint64_t s = std::max(start, entryBase);
          uint64_t e = std::min(end, entryBase + size);
          if (rangeHasMapping(child, level + 1, entryBase, s, e))
            return true;
          continue;
        }

      return true;
    }

  return false;
}


HvError
Stage2Context::unmap(uint64_t ipa, uint64_t size)
{
  if (size == 0)
    return HvError::InvalidArgument;

  if (not util::isAligned(ipa | size, pageSize))
    return HvError::UnalignedAddress;

  uint64_t limit = config_.inputLimit();
  if (ipa >= limit)
    return HvError::None;   // Nothing can be mapped there.
  uint64_t end = (size > limit - ipa) ? limit : ipa + size;

  HvError err = removeRange(root_, config_.startLevel(), 0, ipa, end, true);
  cpu_.dataBarrier();
  cpu_.instructionBarrier();

  if (trace_)
    *trace_ << "stage2: vmid " << gasid_ << " unmap 0x" << std::hex << ipa << "-0x"
            << (end - 1) << std::dec << '\n';

  return err;
}


HvError
Stage2Context::removeRange(uint32_t tab, unsigned level, uint64_t tableBase,
                           uint64_t start, uint64_t end, bool invalidate)
{
  auto& entries = arena_.table(tab);
  uint64_t size = levelSize(level);

  for (unsigned i = levelIndex(start, level); i < PageTableArena::entriesPerTable; ++i)
    {
      uint64_t entryBase = tableBase + i * size;
      if (entryBase >= end)
        break;

      uint64_t s = std::max(start, entryBase);
      uint64_t e = std::min(end, entryBase + size);

      Stage2Pte pte(entries.at(i));
      if (not pte.valid())
        continue;

      uint32_t child = 0;
      if (pte.isTable(level) and tableIndex(pte, child))
        {
          HvError err = removeRange(child, level + 1, entryBase, s, e, invalidate);
          if (arena_.isEmpty(child))
            {
              entries.at(i) = 0;
              arena_.release(child);
              --tableCount_;
            }
          if (err != HvError::None)
            return err;
          continue;
        }

      if (s == entryBase and e == entryBase + size)
        {
          entries.at(i) = 0;
          if (invalidate)
            cpu_.tlbInvalidateIpa(gasid_, entryBase);
          continue;
        }

      // Block partially covered: replace it by a next-level table
      // mapping the same region, then remove the covered part.
      if (not arena_.allocate(child))
        return HvError::TableAllocationFailure;
      ++tableCount_;

      auto& sub = arena_.table(child);
      uint64_t childSize = levelSize(level + 1);
      MapAttrs attrs = pte.attrs();
      for (unsigned j = 0; j < PageTableArena::entriesPerTable; ++j)
        sub.at(j) = Stage2Pte::makeLeaf(pte.address() + j * childSize, level + 1,
                                        attrs, config_.sh).data_;

      // Break before make.
      entries.at(i) = 0;
      cpu_.dataBarrier();
      cpu_.tlbInvalidateIpa(gasid_, entryBase);
      entries.at(i) = Stage2Pte::makeTable(arena_.physAddr(child)).data_;

      if (HvError err = removeRange(child, level + 1, entryBase, s, e, invalidate);
          err != HvError::None)
        return err;
    }

  return HvError::None;
}


void
Stage2Context::releaseSubtree(uint32_t tab, unsigned level)
{
  auto& entries = arena_.table(tab);
  for (auto& entry : entries)
    {
      Stage2Pte pte(entry);
      uint32_t child = 0;
      if (pte.isTable(level) and tableIndex(pte, child))
        {
          releaseSubtree(child, level + 1);
          arena_.release(child);
          --tableCount_;
        }
      entry = 0;
    }
}


void
Stage2Context::invalidateAll()
{
  cpu_.dataBarrier();
  cpu_.tlbInvalidateVmid(gasid_);
  cpu_.dataBarrier();
  cpu_.instructionBarrier();
}


HvError
Stage2Context::translate(uint64_t ipa, TranslationResult& result, AccessType access) const
{
  result = TranslationResult{};

  unsigned level = config_.startLevel();
  result.level = level;

  if (ipa >= config_.inputLimit())
    return HvError::AddressSizeFault;

  uint32_t tab = root_;
  while (true)
    {
      result.level = level;
      Stage2Pte pte(arena_.table(tab).at(levelIndex(ipa, level)));

      if (not pte.valid())
        return HvError::TranslationFault;

      if (pte.isTable(level))
        {
          if (pte.address() >= config_.physAddrLimit())
            return HvError::AddressSizeFault;
          if (not tableIndex(pte, tab))
            return HvError::TranslationFault;
          ++level;
          continue;
        }

      // Blocks are not permitted at level 0.
      if (not pte.isLeaf(level) or level == 0)
        return HvError::TranslationFault;

      if (not pte.accessed())
        return HvError::AccessFlagFault;

      bool allowed = ((access == AccessType::Read and pte.read()) or
                      (access == AccessType::Write and pte.write()) or
                      (access == AccessType::Execute and pte.exec()));
      if (not allowed)
        return HvError::PermissionFault;

      uint64_t size = levelSize(level);
      if (pte.address() >= config_.physAddrLimit())
        return HvError::AddressSizeFault;

      result.hpa = pte.address() + (ipa & (size - 1));
      result.blockSize = size;
      result.attrs = pte.attrs();
      return HvError::None;
    }
}


bool
Stage2Context::isRangeMapped(uint64_t ipa, uint64_t size) const
{
  uint64_t end = ipa + size;
  if (size == 0 or end < ipa)
    return false;

  uint64_t addr = ipa;
  while (addr < end)
    {
      TranslationResult result;
      if (translate(addr, result) != HvError::None and
          translate(addr, result, AccessType::Write) != HvError::None and
          translate(addr, result, AccessType::Execute) != HvError::None)
        return false;

      uint64_t next = util::alignDown(addr, result.blockSize) + result.blockSize;
      if (next <= addr)
        break;  // Wrapped.
      addr = next;
    }
  return true;
}


HvError
Stage2Context::addLazyRegion(uint64_t ipa, uint64_t hpa, uint64_t size, const MapAttrs& attrs)
{
  if (size == 0)
    return HvError::InvalidArgument;

  if (not util::isAligned(ipa | hpa | size, pageSize))
    return HvError::UnalignedAddress;

  uint64_t ipaLimit = config_.inputLimit();
  uint64_t paLimit = config_.physAddrLimit();
  if (size > ipaLimit or ipa > ipaLimit - size or size > paLimit or hpa > paLimit - size)
    return HvError::AddressSizeFault;

  if (overlapsLazyRegion(ipa, size) or
      rangeHasMapping(root_, config_.startLevel(), 0, ipa, ipa + size))
    return HvError::OverlappingMapping;

  lazyRegions_.push_back(LazyRegion{ipa, hpa, size, attrs});
  return HvError::None;
}


bool
Stage2Context::overlapsLazyRegion(uint64_t ipa, uint64_t size) const
{
  for (const auto& region : lazyRegions_)
    if (ipa < region.ipa + region.size and region.ipa < ipa + size)
      return true;
  return false;
}


const LazyRegion*
Stage2Context::findLazyRegion(uint64_t ipa) const
{
  for (const auto& region : lazyRegions_)
    if (region.contains(ipa))
      return &region;
  return nullptr;
}


HvError
Stage2Context::installLazyPage(uint64_t ipa)
{
  const LazyRegion* region = findLazyRegion(ipa);
  if (not region)
    return HvError::TranslationFault;

  uint64_t page = util::alignDown(ipa, pageSize);
  uint64_t hpa = region->hpa + (page - region->ipa);

  HvError err = installLeaf(page, hpa, 3, region->attrs);
  if (err != HvError::None)
    {
      // Free intermediate tables created for the page.
      if (err == HvError::TableAllocationFailure)
        {
          HvError undo = removeRange(root_, config_.startLevel(), 0, page, page + pageSize, false);
          if (undo != HvError::None)
            std::cerr << "Error: Failed to release tables of vmid " << gasid_ << ": "
                      << to_string(undo) << '\n';
        }
      return err;
    }

  cpu_.dataBarrier();

  if (trace_)
    *trace_ << "stage2: vmid " << gasid_ << " lazy page 0x" << std::hex << page
            << " -> 0x" << hpa << std::dec << '\n';
  return HvError::None;
}


void
Stage2Context::printPageTable(std::ostream& out) const
{
  out << "vmid " << gasid_ << " root 0x" << std::hex << rootAddress()
      << " vttbr 0x" << vttbr() << " vtcr 0x" << config_.encode() << std::dec
      << " tables " << tableCount_ << '\n';
  printTable(out, root_, config_.startLevel(), 0);
}


void
Stage2Context::printTable(std::ostream& out, uint32_t tab, unsigned level,
                          uint64_t tableBase) const
{
  const auto& entries = arena_.table(tab);
  uint64_t size = levelSize(level);
  std::string indent(2 * (level + 1), ' ');

  for (unsigned i = 0; i < PageTableArena::entriesPerTable; ++i)
    {
      Stage2Pte pte(entries.at(i));
      if (not pte.valid())
        continue;

      uint64_t base = tableBase + i * size;
      out << indent << 'L' << level << " 0x" << std::hex << std::setfill('0')
          << std::setw(10) << base << "-0x" << std::setw(10) << (base + size - 1);

      uint32_t child = 0;
      if (pte.isTable(level) and tableIndex(pte, child))
        {
          out << " table 0x" << pte.address() << std::dec << '\n';
          printTable(out, child, level + 1, base);
          continue;
        }

      out << " -> 0x" << std::setw(10) << pte.address() << std::dec << ' '
          << (pte.read() ? 'r' : '-') << (pte.write() ? 'w' : '-')
          << (pte.exec() ? 'x' : '-') << ' ' << to_string(pte.memoryType())
          << (pte.accessed() ? "" : " !af") << '\n';
    }
  out << std::setfill(' ');
}
