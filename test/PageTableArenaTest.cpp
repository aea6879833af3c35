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

#include <gtest/gtest.h>
#include "PageTableArena.hpp"

using namespace ArmHyp;


TEST(PageTableArena, AddressesFollowIndices)
{
  PageTableArena arena(0x4000'0000, 8);
  EXPECT_EQ(arena.capacity(), 8u);
  EXPECT_EQ(arena.freeCount(), 8u);

  uint32_t ix = 0;
  ASSERT_TRUE(arena.allocate(ix));
  EXPECT_EQ(ix, 0u);
  EXPECT_EQ(arena.physAddr(ix), 0x4000'0000u);

  ASSERT_TRUE(arena.allocate(ix));
  EXPECT_EQ(arena.physAddr(ix), 0x4000'1000u);

  uint32_t found = 0;
  EXPECT_TRUE(arena.indexOf(0x4000'1000, found));
  EXPECT_EQ(found, ix);
  EXPECT_FALSE(arena.indexOf(0x4000'1008, found));
  EXPECT_FALSE(arena.indexOf(0x3fff'f000, found));
  EXPECT_FALSE(arena.indexOf(0x4000'8000, found));
}


TEST(PageTableArena, ExhaustionAndRelease)
{
  PageTableArena arena(0x1000, 2);
  uint32_t a = 0, b = 0, c = 0;
  ASSERT_TRUE(arena.allocate(a));
  ASSERT_TRUE(arena.allocate(b));
  EXPECT_FALSE(arena.allocate(c));
  EXPECT_EQ(arena.freeCount(), 0u);

  arena.release(a);
  EXPECT_FALSE(arena.isAllocated(a));
  arena.release(a);
  EXPECT_EQ(arena.freeCount(), 1u);

  ASSERT_TRUE(arena.allocate(c));
  EXPECT_EQ(c, a);
}


TEST(PageTableArena, AllocatedTablesAreZeroed)
{
  PageTableArena arena(0, 1);
  uint32_t ix = 0;
  ASSERT_TRUE(arena.allocate(ix));
  arena.table(ix).at(5) = 0x403;
  EXPECT_FALSE(arena.isEmpty(ix));

  arena.release(ix);
  ASSERT_TRUE(arena.allocate(ix));
  EXPECT_TRUE(arena.isEmpty(ix));
  EXPECT_EQ(arena.table(ix).at(5), 0u);
}
