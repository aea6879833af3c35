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
#include <map>
#include <memory>
#include <vector>
#include "CpuBackend.hpp"
#include "GasidAllocator.hpp"
#include "Lock.hpp"
#include "PageTableArena.hpp"
#include "Stage2.hpp"
#include "Stage2Fault.hpp"

namespace ArmHyp
{

  /// Guest address spaces: binds a guest address-space id to a stage-2
  /// context for each live guest and serializes the modification of
  /// their translation tables. Translation tables come from the given
  /// pool and TLB maintenance goes through the given core.
  class VmManager
  {
  public:

    VmManager(GasidAllocator& gasids, PageTableArena& arena, CpuBackend& cpu,
              const Stage2Config& config = Stage2Config{});

    VmManager(const VmManager&) = delete;
    VmManager& operator=(const VmManager&) = delete;

    /// Create a guest with an empty address space and set gasid to its
    /// id. Return GasidExhausted or TableAllocationFailure on failure:
    /// no id is consumed in that case.
    HvError createGuest(Gasid& gasid);

    /// Invalidate every cached translation of the given guest, release
    /// its tables and free its id. The guest must not be running on any
    /// core.
    HvError destroyGuest(Gasid gasid);

    /// Map a range of the given guest. See Stage2Context::map.
    HvError map(Gasid gasid, uint64_t ipa, uint64_t hpa, uint64_t size,
                const MapAttrs& attrs = MapAttrs{});

    /// Unmap a range of the given guest. See Stage2Context::unmap.
    HvError unmap(Gasid gasid, uint64_t ipa, uint64_t size);

    /// Back a range of the given guest on demand.
    HvError addLazyRegion(Gasid gasid, uint64_t ipa, uint64_t hpa, uint64_t size,
                          const MapAttrs& attrs = MapAttrs{});

    /// Translate a guest-physical address of the given guest.
    HvError translate(Gasid gasid, uint64_t ipa, TranslationResult& result,
                      AccessType access = AccessType::Read) const;

    /// Resolve a stage-2 abort taken by the given guest. A translation
    /// fault inside a lazy region installs the page and returns None:
    /// the guest may be resumed. Any other fault fills error and returns
    /// the corresponding error code for delivery to the guest.
    HvError handleStage2Abort(Gasid gasid, const AbortInfo& info, GuestMemoryError& error);

    /// Return the context of the given guest or nullptr if no such
    /// guest. The context stays valid until the guest is destroyed.
    Stage2Context* findContext(Gasid gasid);

    const Stage2Context* findContext(Gasid gasid) const;

    /// Return the number of live guests.
    unsigned guestCount() const;

    /// Return the ids of the live guests in increasing order.
    std::vector<Gasid> guestIds() const;

    const Stage2Config& config() const
    { return config_; }

    /// Print every guest's translation tables.
    void printPageTables(std::ostream& out) const;

    /// Print a line per guest creation/destruction and per resolved or
    /// reported abort to the given stream (default std::cerr). Applies
    /// to the contexts of the guests as well.
    void enableTrace(bool flag, std::ostream* out = nullptr);

  private:

    GasidAllocator& gasids_;
    PageTableArena& arena_;
    CpuBackend& cpu_;
    Stage2Config config_;

    std::map<Gasid, std::unique_ptr<Stage2Context>> guests_;
    mutable SpinLock lock_;
    std::ostream* trace_ = nullptr;
  };

}
