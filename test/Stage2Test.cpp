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

#include <memory>
#include <sstream>
#include <gtest/gtest.h>
#include "SimCpu.hpp"
#include "Stage2.hpp"

using namespace ArmHyp;


TEST(Stage2Config, DefaultEncoding)
{
  Stage2Config config;
  EXPECT_EQ(config.encode(), 0x23550u);
  EXPECT_EQ(config.startLevel(), 1u);
  EXPECT_EQ(config.inputBits(), 48u);
  EXPECT_EQ(config.walkBits(), 39u);
  EXPECT_EQ(config.physAddrBits(), 48u);
  EXPECT_EQ(Stage2Config::decode(config.encode()), config);

  Stage2Config small = Stage2Config::default40Bit();
  EXPECT_EQ(small.inputBits(), 40u);
  EXPECT_EQ(small.physAddrBits(), 40u);
  EXPECT_EQ(Stage2Config::decode(small.encode()), small);
}


TEST(Stage2Config, Validation)
{
  std::string message;
  EXPECT_TRUE(Stage2Config{}.validate(message));

  Stage2Config config;
  config.tg = 1;
  EXPECT_FALSE(config.validate(message));
  EXPECT_FALSE(message.empty());

  config = Stage2Config{};
  config.ps = 5;
  EXPECT_FALSE(config.validate(message));

  config = Stage2Config{};
  config.t0sz = 12;
  EXPECT_FALSE(config.validate(message));

  unsigned ps = 0;
  EXPECT_TRUE(Stage2Config::psForBits(40, ps));
  EXPECT_EQ(ps, 1u);
  EXPECT_FALSE(Stage2Config::psForBits(36, ps));
}


TEST(Vttbr, PackPlacesIdAndRoot)
{
  EXPECT_EQ(packVttbr(5, 0x4000'1000), (uint64_t(5) << 56) | 0x4000'1000);

  Gasid gasid = 0;
  uint64_t root = 0;
  unpackVttbr(packVttbr(255, 0xffff'ffff'f000), gasid, root);
  EXPECT_EQ(gasid, 255u);
  EXPECT_EQ(root, 0xffff'ffff'f000u);
}


TEST(Vttbr, PackMasksOutOfRangeFields)
{
  uint64_t value = packVttbr(0x1ff, 0xffff'8000'0000'1fff);
  Gasid gasid = 0;
  uint64_t root = 0;
  unpackVttbr(value, gasid, root);
  EXPECT_EQ(gasid, 0xffu);
  EXPECT_EQ(root, 0x8000'0000'1000u);
  EXPECT_EQ(value & 0x00ff'0000'0000'0fff, 0u);
}


TEST(Vttbr, RoundTripOverIdsAndAddresses)
{
  for (Gasid id : { 1u, 2u, 100u, 254u, 255u })
    for (uint64_t addr : { UINT64_C(0), UINT64_C(0x1000), UINT64_C(0x8000'0000),
                           UINT64_C(0x1234'5678'9000), UINT64_C(0xffff'ffff'f000) })
      {
        Gasid gasid = 0;
        uint64_t root = 0;
        unpackVttbr(packVttbr(id, addr), gasid, root);
        EXPECT_EQ(gasid, id);
        EXPECT_EQ(root, addr);
      }
}


class Stage2Test : public ::testing::Test
{
protected:

  void SetUp() override
  {
    ASSERT_EQ(Stage2Context::create(1, Stage2Config{}, arena_, cpu_, context_), HvError::None);
  }

  SimCpu cpu_;
  PageTableArena arena_{0x4000'0000, 64};
  std::unique_ptr<Stage2Context> context_;
};


TEST_F(Stage2Test, CreateUsesRootTable)
{
  EXPECT_EQ(context_->gasid(), 1u);
  EXPECT_EQ(context_->tableCount(), 1u);
  EXPECT_EQ(arena_.freeCount(), 63u);
  EXPECT_EQ(context_->vttbr(), packVttbr(1, context_->rootAddress()));
}


TEST_F(Stage2Test, MapThenTranslatePage)
{
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);

  TranslationResult result;
  ASSERT_EQ(context_->translate(0x1800, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8000'0800u);
  EXPECT_EQ(result.level, 3u);
  EXPECT_EQ(result.blockSize, 0x1000u);
  EXPECT_EQ(result.attrs, MapAttrs{});

  // Root, level 2 and level 3 tables.
  EXPECT_EQ(context_->tableCount(), 3u);
}


TEST_F(Stage2Test, TranslateOutsideMappingFaults)
{
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);

  TranslationResult result;
  EXPECT_EQ(context_->translate(0x2000, result), HvError::TranslationFault);
  EXPECT_EQ(result.level, 3u);

  EXPECT_EQ(context_->translate(0x4000'0000, result), HvError::TranslationFault);
  EXPECT_EQ(result.level, 1u);

  EXPECT_EQ(context_->translate(uint64_t(1) << 39, result), HvError::AddressSizeFault);
}


TEST_F(Stage2Test, LargestBlocksAreUsed)
{
  ASSERT_EQ(context_->map(0x20'0000, 0x8020'0000, 0x20'0000, MapAttrs{}), HvError::None);
  ASSERT_EQ(context_->map(0x4000'0000, 0xc000'0000, 0x4000'0000, MapAttrs{}), HvError::None);

  TranslationResult result;
  ASSERT_EQ(context_->translate(0x21'2345, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8021'2345u);
  EXPECT_EQ(result.level, 2u);
  EXPECT_EQ(result.blockSize, 0x20'0000u);

  ASSERT_EQ(context_->translate(0x7fff'ffff, result), HvError::None);
  EXPECT_EQ(result.hpa, 0xffff'ffffu);
  EXPECT_EQ(result.level, 1u);

  // Root and one level 2 table.
  EXPECT_EQ(context_->tableCount(), 2u);
}


TEST_F(Stage2Test, MisalignedHostAddressFallsBackToPages)
{
  ASSERT_EQ(context_->map(0x20'0000, 0x8000'1000, 0x20'0000, MapAttrs{}), HvError::None);

  TranslationResult result;
  ASSERT_EQ(context_->translate(0x3f'f000, result), HvError::None);
  EXPECT_EQ(result.level, 3u);
  EXPECT_EQ(result.hpa, 0x8020'0000u);
  EXPECT_TRUE(context_->isRangeMapped(0x20'0000, 0x20'0000));
}


TEST_F(Stage2Test, MapRejectsBadArguments)
{
  EXPECT_EQ(context_->map(0x1000, 0x8000'0000, 0, MapAttrs{}), HvError::InvalidArgument);
  EXPECT_EQ(context_->map(0x1001, 0x8000'0000, 0x1000, MapAttrs{}), HvError::UnalignedAddress);
  EXPECT_EQ(context_->map(0x1000, 0x8000'0800, 0x1000, MapAttrs{}), HvError::UnalignedAddress);
  EXPECT_EQ(context_->map(0x1000, 0x8000'0000, 0x1800, MapAttrs{}), HvError::UnalignedAddress);
  EXPECT_EQ(context_->map(uint64_t(1) << 39, 0x8000'0000, 0x1000, MapAttrs{}),
            HvError::AddressSizeFault);
  EXPECT_EQ(context_->map(0x1000, uint64_t(1) << 48, 0x1000, MapAttrs{}),
            HvError::AddressSizeFault);
  EXPECT_EQ(context_->tableCount(), 1u);
}


TEST_F(Stage2Test, OverlapIsRejectedWithoutChange)
{
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  unsigned tables = context_->tableCount();

  EXPECT_EQ(context_->map(0x0, 0x9000'0000, 0x4000, MapAttrs{}), HvError::OverlappingMapping);
  EXPECT_EQ(context_->tableCount(), tables);

  TranslationResult result;
  EXPECT_EQ(context_->translate(0x0, result), HvError::TranslationFault);
  ASSERT_EQ(context_->translate(0x1000, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8000'0000u);
}


TEST_F(Stage2Test, UnmapThenRemap)
{
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  ASSERT_EQ(context_->unmap(0x1000, 0x1000), HvError::None);

  TranslationResult result;
  EXPECT_EQ(context_->translate(0x1800, result), HvError::TranslationFault);

  // Empty intermediate tables were returned to the pool.
  EXPECT_EQ(context_->tableCount(), 1u);
  EXPECT_EQ(arena_.freeCount(), 63u);

  ASSERT_EQ(context_->map(0x1000, 0x8800'0000, 0x1000, MapAttrs{}), HvError::None);
  ASSERT_EQ(context_->translate(0x1800, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8800'0800u);
}


TEST_F(Stage2Test, UnmapOfUnmappedRangeIsNoOp)
{
  EXPECT_EQ(context_->unmap(0x10'0000, 0x10'0000), HvError::None);
  EXPECT_EQ(context_->unmap(uint64_t(1) << 40, 0x1000), HvError::None);
  EXPECT_EQ(context_->unmap(0x1000, 0), HvError::InvalidArgument);
  EXPECT_EQ(context_->unmap(0x1800, 0x1000), HvError::UnalignedAddress);
}


TEST_F(Stage2Test, PartialUnmapSplitsBlock)
{
  ASSERT_EQ(context_->map(0x20'0000, 0x8020'0000, 0x20'0000, MapAttrs{}), HvError::None);
  cpu_.clearCounts();

  ASSERT_EQ(context_->unmap(0x20'1000, 0x1000), HvError::None);
  EXPECT_GE(cpu_.tlbiCount(), 2u);

  TranslationResult result;
  ASSERT_EQ(context_->translate(0x20'0000, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x8020'0000u);
  EXPECT_EQ(result.level, 3u);

  EXPECT_EQ(context_->translate(0x20'1800, result), HvError::TranslationFault);

  ASSERT_EQ(context_->translate(0x3f'f000, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x803f'f000u);

  EXPECT_FALSE(context_->isRangeMapped(0x20'0000, 0x20'0000));
  EXPECT_TRUE(context_->isRangeMapped(0x20'2000, 0x1f'e000));
}


TEST_F(Stage2Test, AttributesAreEnforced)
{
  MapAttrs device{true, false, false, MemoryType::Device};
  ASSERT_EQ(context_->map(0x900'0000, 0x900'0000, 0x1000, device), HvError::None);

  TranslationResult result;
  ASSERT_EQ(context_->translate(0x900'0004, result), HvError::None);
  EXPECT_EQ(result.attrs, device);

  EXPECT_EQ(context_->translate(0x900'0004, result, AccessType::Write), HvError::PermissionFault);
  EXPECT_EQ(result.level, 3u);
  EXPECT_EQ(context_->translate(0x900'0004, result, AccessType::Execute),
            HvError::PermissionFault);
}


TEST_F(Stage2Test, LazyRegionInstallsSinglePage)
{
  ASSERT_EQ(context_->addLazyRegion(0x10'0000, 0x9000'0000, 0x1'0000, MapAttrs{}), HvError::None);

  TranslationResult result;
  EXPECT_EQ(context_->translate(0x10'5123, result), HvError::TranslationFault);
  ASSERT_NE(context_->findLazyRegion(0x10'5123), nullptr);
  EXPECT_EQ(context_->findLazyRegion(0x11'0000), nullptr);

  ASSERT_EQ(context_->installLazyPage(0x10'5123), HvError::None);
  ASSERT_EQ(context_->translate(0x10'5123, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x9000'5123u);
  EXPECT_EQ(context_->translate(0x10'6000, result), HvError::TranslationFault);

  EXPECT_EQ(context_->installLazyPage(0x20'0000), HvError::TranslationFault);
}


TEST_F(Stage2Test, LazyRegionMayNotOverlap)
{
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  EXPECT_EQ(context_->addLazyRegion(0x0, 0x9000'0000, 0x1'0000, MapAttrs{}),
            HvError::OverlappingMapping);

  ASSERT_EQ(context_->addLazyRegion(0x10'0000, 0x9000'0000, 0x1'0000, MapAttrs{}), HvError::None);
  EXPECT_EQ(context_->addLazyRegion(0x10'8000, 0x9100'0000, 0x1'0000, MapAttrs{}),
            HvError::OverlappingMapping);
}


TEST_F(Stage2Test, MapMayNotOverlapLazyRegion)
{
  ASSERT_EQ(context_->addLazyRegion(0x1'0000, 0x9000'0000, 0x4000, MapAttrs{}), HvError::None);

  EXPECT_EQ(context_->map(0x1'0000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::OverlappingMapping);
  EXPECT_EQ(context_->map(0xf000, 0x8000'0000, 0x2000, MapAttrs{}), HvError::OverlappingMapping);
  EXPECT_EQ(context_->map(0x1'3000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::OverlappingMapping);

  TranslationResult result;
  EXPECT_EQ(context_->translate(0x1'0000, result), HvError::TranslationFault);

  // Neighbours on both sides are free.
  EXPECT_EQ(context_->map(0xf000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  EXPECT_EQ(context_->map(0x1'4000, 0x8000'1000, 0x1000, MapAttrs{}), HvError::None);

  // A fault inside the region still backs it from the region's memory.
  ASSERT_EQ(context_->installLazyPage(0x1'0010), HvError::None);
  ASSERT_EQ(context_->translate(0x1'0010, result), HvError::None);
  EXPECT_EQ(result.hpa, 0x9000'0010u);
}


TEST_F(Stage2Test, PrintShowsLeaves)
{
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  std::ostringstream oss;
  context_->printPageTable(oss);
  std::string text = oss.str();
  EXPECT_NE(text.find("vmid 1"), std::string::npos);
  EXPECT_NE(text.find("L3"), std::string::npos);
  EXPECT_NE(text.find("rwx normal-wb"), std::string::npos);
}


TEST_F(Stage2Test, TraceReportsMaps)
{
  std::ostringstream oss;
  context_->enableTrace(true, &oss);
  ASSERT_EQ(context_->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  EXPECT_NE(oss.str().find("map 0x1000-0x1fff -> 0x80000000"), std::string::npos);
}


TEST(Stage2Rollback, PoolExhaustionLeavesTablesUnchanged)
{
  SimCpu cpu;
  PageTableArena arena(0x4000'0000, 2);
  std::unique_ptr<Stage2Context> context;
  ASSERT_EQ(Stage2Context::create(1, Stage2Config{}, arena, cpu, context), HvError::None);

  EXPECT_EQ(context->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}),
            HvError::TableAllocationFailure);
  EXPECT_EQ(context->tableCount(), 1u);
  EXPECT_EQ(arena.freeCount(), 1u);
}


TEST(Stage2Rollback, PartialMappingIsUndone)
{
  SimCpu cpu;
  PageTableArena arena(0x4000'0000, 3);
  std::unique_ptr<Stage2Context> context;
  ASSERT_EQ(Stage2Context::create(1, Stage2Config{}, arena, cpu, context), HvError::None);

  // Needs a level 3 table on each side of the 2 MiB boundary.
  EXPECT_EQ(context->map(0x1f'f000, 0x8000'0000, 0x2000, MapAttrs{}),
            HvError::TableAllocationFailure);

  TranslationResult result;
  EXPECT_EQ(context->translate(0x1f'f000, result), HvError::TranslationFault);
  EXPECT_EQ(context->tableCount(), 1u);
  EXPECT_EQ(arena.freeCount(), 2u);
}


TEST(Stage2Rollback, ContextReleasesTablesOnDestruction)
{
  SimCpu cpu;
  PageTableArena arena(0x4000'0000, 16);
  {
    std::unique_ptr<Stage2Context> context;
    ASSERT_EQ(Stage2Context::create(3, Stage2Config{}, arena, cpu, context), HvError::None);
    ASSERT_EQ(context->map(0x0, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
    ASSERT_EQ(context->map(0x4000'0000, 0x9000'0000, 0x1000, MapAttrs{}), HvError::None);
    EXPECT_EQ(arena.freeCount(), 11u);
  }
  EXPECT_EQ(arena.freeCount(), 16u);
}


TEST(Stage2Tlb, UnmapInvalidatesOnlyItsOwnId)
{
  SimCpu cpu;
  PageTableArena arena(0x4000'0000, 16);
  std::unique_ptr<Stage2Context> first, second;
  ASSERT_EQ(Stage2Context::create(1, Stage2Config{}, arena, cpu, first), HvError::None);
  ASSERT_EQ(Stage2Context::create(2, Stage2Config{}, arena, cpu, second), HvError::None);

  ASSERT_EQ(first->map(0x1000, 0x8000'0000, 0x1000, MapAttrs{}), HvError::None);
  ASSERT_EQ(second->map(0x1000, 0x9000'0000, 0x1000, MapAttrs{}), HvError::None);

  Tlb& tlb = cpu.tlb();
  ASSERT_TRUE(tlb.insertEntry(1, 0x8'0000, 1, 3, true, true, true));
  ASSERT_TRUE(tlb.insertEntry(1, 0x9'0000, 2, 3, true, true, true));

  ASSERT_EQ(first->unmap(0x1000, 0x1000), HvError::None);
  EXPECT_EQ(tlb.findEntry(1, 1), nullptr);
  ASSERT_NE(tlb.findEntry(1, 2), nullptr);
  EXPECT_EQ(tlb.findEntry(1, 2)->hostPageNum_, 0x9'0000u);

  second->invalidateAll();
  EXPECT_EQ(tlb.validCount(2), 0u);
}
