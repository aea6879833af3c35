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

#include <bit>
#include <iomanip>
#include "Tlb.hpp"
#include "util.hpp"

using namespace ArmHyp;


Tlb::Tlb(unsigned size)
{
  if (size != 0 and not util::isPowerOf2(size))
    size = unsigned(1) << std::bit_width(size);  // Round up.
  entries_.resize(size);
}


bool
Tlb::insertEntry(uint64_t ipaPageNum, uint64_t hostPageNum, uint32_t vmid,
                 unsigned level, bool read, bool write, bool exec)
{
  TlbEntry te;
  te.valid_ = true;
  te.ipaPageNum_ = ipaPageNum;
  te.hostPageNum_ = hostPageNum;
  te.vmid_ = vmid;
  te.level_ = level;
  te.read_ = read;
  te.write_ = write;
  te.exec_ = exec;
  return insertEntry(te);
}


bool
Tlb::insertEntry(const TlbEntry& te)
{
  auto* entry = getEntry(te.ipaPageNum_, te.vmid_);

  if (not entry)
    return false;

  if (entry->valid_ and entry->counter_ & 2 and
      not (entry->ipaPageNum_ == te.ipaPageNum_ and entry->vmid_ == te.vmid_))
    {
      --entry->counter_;
      return false;
    }

  *entry = te;
  entry->counter_ = 0;
  return true;
}


unsigned
Tlb::validCount(uint32_t vmid) const
{
  unsigned count = 0;
  for (const auto& te : entries_)
    if (te.valid_ and te.vmid_ == vmid)
      ++count;
  return count;
}


void
Tlb::printTlb(std::ostream& ost) const
{
  for (const auto&te: entries_)
    printEntry(ost, te);
}


void
Tlb::printEntry(std::ostream& ost, const TlbEntry& te) const
{
  if (not te.valid_)
    return;
  ost << std::hex << std::setfill('0') << std::setw(10) << te.ipaPageNum_ << std::dec << ",";
  ost << std::setfill('0') << std::setw(3) << te.vmid_;
  ost << " -> " << std::hex << std::setfill('0') << std::setw(10) << te.hostPageNum_ << std::dec;
  ost << " P:" << (te.read_?"r":"-") << (te.write_?"w":"-") << (te.exec_?"x":"-");
  ost << " S:" << blockSizeName(te.level_) << "\n";
}
