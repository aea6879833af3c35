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

#include <sstream>
#include <gtest/gtest.h>
#include "SimCpu.hpp"
#include "VmManager.hpp"

using namespace ArmHyp;


class VmManagerTest : public ::testing::Test
{
protected:

  SimCpu cpu_;
  GasidAllocator gasids_;
  PageTableArena arena_{0x4000'0000, 64};
  VmManager vms_{gasids_, arena_, cpu_};
};


TEST_F(VmManagerTest, CreateMapTranslateDestroy)
{
  Gasid gasid = 0;
  ASSERT_EQ(vms_.createGuest(gasid), HvError::None);
  EXPECT_EQ(gasid, 1u);
  EXPECT_TRUE(gasids_.isAllocated(1));
  EXPECT_EQ(vms_.guestCount(), 1u);

  ASSERT_EQ(vms_.map(gasid, 0x1000, 0x8000'0000, 0x1000), HvError::None);

  TranslationResult result;
  ASSERT_EQ(vms_.translate(gasid, 0x1800, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8000'0800u);

  cpu_.clearCounts();
  ASSERT_EQ(vms_.destroyGuest(gasid), HvError::None);
  EXPECT_FALSE(gasids_.isAllocated(1));
  EXPECT_EQ(vms_.guestCount(), 0u);
  EXPECT_EQ(arena_.freeCount(), arena_.capacity());
  EXPECT_EQ(cpu_.tlbiCount(), 1u);

  ASSERT_EQ(vms_.createGuest(gasid), HvError::None);
  EXPECT_NE(gasid, 0u);
}


TEST_F(VmManagerTest, UnknownGuestIsRejected)
{
  TranslationResult result;
  EXPECT_EQ(vms_.destroyGuest(5), HvError::InvalidArgument);
  EXPECT_EQ(vms_.map(5, 0, 0x8000'0000, 0x1000), HvError::InvalidArgument);
  EXPECT_EQ(vms_.unmap(5, 0, 0x1000), HvError::InvalidArgument);
  EXPECT_EQ(vms_.addLazyRegion(5, 0, 0x8000'0000, 0x1000), HvError::InvalidArgument);
  EXPECT_EQ(vms_.translate(5, 0, result), HvError::InvalidArgument);
  EXPECT_EQ(vms_.findContext(5), nullptr);
}


TEST_F(VmManagerTest, GuestsAreIsolated)
{
  Gasid first = 0, second = 0;
  ASSERT_EQ(vms_.createGuest(first), HvError::None);
  ASSERT_EQ(vms_.createGuest(second), HvError::None);
  EXPECT_NE(first, second);

  ASSERT_EQ(vms_.map(first, 0x0, 0x8000'0000, 0x20'0000), HvError::None);
  ASSERT_EQ(vms_.map(second, 0x0, 0x9000'0000, 0x20'0000), HvError::None);

  TranslationResult result;
  ASSERT_EQ(vms_.translate(first, 0x1234, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8000'1234u);
  ASSERT_EQ(vms_.translate(second, 0x1234, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x9000'1234u);

  ASSERT_EQ(vms_.unmap(first, 0x0, 0x20'0000), HvError::None);
  EXPECT_EQ(vms_.translate(first, 0x1234, result), HvError::TranslationFault);
  EXPECT_EQ(vms_.translate(second, 0x1234, result), HvError::None);

  std::vector<Gasid> ids = vms_.guestIds();
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids.at(0), first);
  EXPECT_EQ(ids.at(1), second);
}


TEST_F(VmManagerTest, LazyFaultIsResolved)
{
  Gasid gasid = 0;
  ASSERT_EQ(vms_.createGuest(gasid), HvError::None);
  ASSERT_EQ(vms_.addLazyRegion(gasid, 0x10'0000, 0x9000'0000, 0x10'0000), HvError::None);

  AbortInfo info;
  info.ec = ExceptionClass::DATA_ABORT_LOWER;
  info.kind = FaultKind::Translation;
  info.level = 1;
  info.ipa = 0x10'2345;
  info.ipaValid = true;

  GuestMemoryError error;
  ASSERT_EQ(vms_.handleStage2Abort(gasid, info, error), HvError::None);

  TranslationResult result;
  ASSERT_EQ(vms_.translate(gasid, 0x10'2345, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x9000'2345u);
}


TEST_F(VmManagerTest, UnresolvableFaultIsSurfaced)
{
  Gasid gasid = 0;
  ASSERT_EQ(vms_.createGuest(gasid), HvError::None);

  AbortInfo info;
  info.ec = ExceptionClass::DATA_ABORT_LOWER;
  info.kind = FaultKind::Translation;
  info.level = 1;
  info.ipa = 0x50'0000;
  info.ipaValid = true;
  info.write = true;

  GuestMemoryError error;
  EXPECT_EQ(vms_.handleStage2Abort(gasid, info, error), HvError::TranslationFault);
  EXPECT_EQ(error.gasid, gasid);
  EXPECT_EQ(error.ipa, 0x50'0000u);
  EXPECT_EQ(error.kind, FaultKind::Translation);
  EXPECT_EQ(error.level, 1u);
  EXPECT_TRUE(error.write);

  info.kind = FaultKind::Permission;
  info.level = 3;
  EXPECT_EQ(vms_.handleStage2Abort(gasid, info, error), HvError::PermissionFault);
  EXPECT_EQ(error.kind, FaultKind::Permission);
}


TEST_F(VmManagerTest, ExhaustedIds)
{
  PageTableArena arena(0x4000'0000, 300);
  GasidAllocator gasids;
  VmManager vms(gasids, arena, cpu_);

  Gasid gasid = 0;
  for (unsigned i = 0; i < GasidAllocator::capacity(); ++i)
    ASSERT_EQ(vms.createGuest(gasid), HvError::None);

  EXPECT_EQ(vms.createGuest(gasid), HvError::GasidExhausted);
  EXPECT_EQ(vms.guestCount(), 255u);

  ASSERT_EQ(vms.destroyGuest(17), HvError::None);
  ASSERT_EQ(vms.createGuest(gasid), HvError::None);
  EXPECT_EQ(gasid, 17u);
}


TEST_F(VmManagerTest, PoolExhaustionReleasesId)
{
  PageTableArena arena(0x4000'0000, 1);
  GasidAllocator gasids;
  VmManager vms(gasids, arena, cpu_);

  Gasid gasid = 0;
  ASSERT_EQ(vms.createGuest(gasid), HvError::None);
  EXPECT_EQ(vms.createGuest(gasid), HvError::TableAllocationFailure);
  EXPECT_EQ(gasids.liveCount(), 1u);
  EXPECT_EQ(vms.guestCount(), 1u);
}


TEST_F(VmManagerTest, TraceAndDump)
{
  std::ostringstream trace;
  vms_.enableTrace(true, &trace);

  Gasid gasid = 0;
  ASSERT_EQ(vms_.createGuest(gasid), HvError::None);
  ASSERT_EQ(vms_.map(gasid, 0x0, 0x8000'0000, 0x1000), HvError::None);
  EXPECT_NE(trace.str().find("created guest 1"), std::string::npos);
  EXPECT_NE(trace.str().find("map 0x0-0xfff"), std::string::npos);

  std::ostringstream dump;
  vms_.printPageTables(dump);
  EXPECT_NE(dump.str().find("vmid 1"), std::string::npos);
}
