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

#include <set>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "GasidAllocator.hpp"

using namespace ArmHyp;


TEST(GasidAllocator, AllocatesDistinctNonZeroIds)
{
  GasidAllocator gasids;
  std::set<Gasid> seen;

  for (unsigned i = 0; i < GasidAllocator::capacity(); ++i)
    {
      Gasid id = 0;
      ASSERT_EQ(gasids.allocate(id), HvError::None);
      EXPECT_NE(id, 0u);
      EXPECT_LE(id, GasidAllocator::maxGasid);
      EXPECT_TRUE(seen.insert(id).second) << "duplicate id " << id;
    }

  EXPECT_EQ(gasids.liveCount(), 255u);

  Gasid id = 0;
  EXPECT_EQ(gasids.allocate(id), HvError::GasidExhausted);
}


TEST(GasidAllocator, FirstIdIsOne)
{
  GasidAllocator gasids;
  Gasid id = 0;
  ASSERT_EQ(gasids.allocate(id), HvError::None);
  EXPECT_EQ(id, 1u);
  EXPECT_TRUE(gasids.isAllocated(1));
}


TEST(GasidAllocator, ReallocationReturnsAFreeId)
{
  GasidAllocator gasids;
  Gasid id = 0;
  for (unsigned i = 0; i < GasidAllocator::capacity(); ++i)
    ASSERT_EQ(gasids.allocate(id), HvError::None);

  gasids.free(77);
  EXPECT_FALSE(gasids.isAllocated(77));

  ASSERT_EQ(gasids.allocate(id), HvError::None);
  EXPECT_EQ(id, 77u);
  EXPECT_EQ(gasids.allocate(id), HvError::GasidExhausted);
}


TEST(GasidAllocator, ZeroIsNeverAllocated)
{
  GasidAllocator gasids;
  EXPECT_FALSE(gasids.isAllocated(0));

  Gasid id = 0;
  while (gasids.allocate(id) == HvError::None)
    EXPECT_NE(id, 0u);

  EXPECT_FALSE(gasids.isAllocated(0));
}


TEST(GasidAllocator, FreeOfZeroOrFreeIdIsIgnored)
{
  GasidAllocator gasids;
  Gasid id = 0;
  ASSERT_EQ(gasids.allocate(id), HvError::None);

  gasids.free(0);
  gasids.free(200);
  gasids.free(1000);
  EXPECT_EQ(gasids.liveCount(), 1u);

  gasids.free(id);
  gasids.free(id);
  EXPECT_EQ(gasids.liveCount(), 0u);
}


TEST(GasidAllocator, ConcurrentAllocationYieldsUniqueIds)
{
  GasidAllocator gasids;
  constexpr unsigned threadCount = 4;
  std::vector<std::vector<Gasid>> got(threadCount);
  std::vector<std::thread> threads;

  for (unsigned t = 0; t < threadCount; ++t)
    threads.emplace_back([&gasids, &got, t]() {
      Gasid id = 0;
      for (unsigned i = 0; i < 60; ++i)
        if (gasids.allocate(id) == HvError::None)
          got.at(t).push_back(id);
    });
  for (auto& thread : threads)
    thread.join();

  std::set<Gasid> all;
  for (const auto& ids : got)
    for (Gasid id : ids)
      EXPECT_TRUE(all.insert(id).second) << "id " << id << " handed out twice";

  EXPECT_EQ(all.size(), 240u);
  EXPECT_EQ(gasids.liveCount(), 240u);
}
