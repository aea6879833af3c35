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
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "Session.hpp"
#include "SysRegFields.hpp"

using namespace ArmHyp;


class SessionTest : public ::testing::Test
{
protected:

  void SetUp() override
  {
    args_.configFile = ARMHYP_SAMPLE_CONFIG;
    ASSERT_TRUE(config_.loadConfigFile(args_.configFile));
  }

  Args args_;
  HvConfig config_;
  Session session_;
};


TEST_F(SessionTest, DefineFromSample)
{
  ASSERT_TRUE(session_.defineSystem(args_, config_));
  EXPECT_EQ(session_.coreCount(), 2u);
  EXPECT_EQ(session_.params().guests.size(), 2u);
  EXPECT_EQ(session_.params().sliceUs, 10'000u);
  EXPECT_EQ(session_.core(1).coreId(), 1u);
}


TEST_F(SessionTest, CommandLineOverrides)
{
  args_.cores = 3;
  args_.sliceUs = 200;
  ASSERT_TRUE(session_.defineSystem(args_, config_));
  EXPECT_EQ(session_.coreCount(), 3u);
  EXPECT_EQ(session_.params().sliceUs, 200u);
}


TEST_F(SessionTest, ConfigureCreatesGuests)
{
  ASSERT_TRUE(session_.defineSystem(args_, config_));
  ASSERT_TRUE(session_.configureSystem(args_));

  for (unsigned ix = 0; ix < session_.coreCount(); ++ix)
    EXPECT_TRUE(HcrFields(session_.core(ix).readSysReg(SysReg::HCR_EL2)).bits_.VM);
  EXPECT_EQ(session_.core(0).sharedTlb(), session_.core(1).sharedTlb());

  ASSERT_EQ(session_.guestIds().size(), 2u);
  EXPECT_NE(session_.guestIds().at(0), session_.guestIds().at(1));
  ASSERT_EQ(session_.vcpus().size(), 3u);
  EXPECT_EQ(session_.vcpus().at(0)->gasid(), session_.guestIds().at(0));
  EXPECT_EQ(session_.vcpus().at(1)->gasid(), session_.guestIds().at(0));
  EXPECT_EQ(session_.vcpus().at(2)->gasid(), session_.guestIds().at(1));

  // The lazy region of the second guest is not backed yet.
  TranslationResult result;
  EXPECT_EQ(session_.vmManager().translate(session_.guestIds().at(1), 0x0, result),
            HvError::TranslationFault);
}


TEST_F(SessionTest, RunEveryVcpuOnce)
{
  ASSERT_TRUE(session_.defineSystem(args_, config_));
  ASSERT_TRUE(session_.configureSystem(args_));
  ASSERT_TRUE(session_.run(args_));

  EXPECT_EQ(session_.injectedCount(), 3u);
  EXPECT_EQ(session_.sliceExpiryCount(), 3u);

  for (const auto& vcpu : session_.vcpus())
    EXPECT_FALSE(vcpu->isRunning());
  for (unsigned ix = 0; ix < session_.coreCount(); ++ix)
    EXPECT_EQ(session_.worldSwitch(ix).current(), nullptr);

  TranslationResult result;
  ASSERT_EQ(session_.vmManager().translate(session_.guestIds().at(1), 0x10, result),
            HvError::None);
  EXPECT_EQ(result.hpa, 0x9000'0010u);
}


TEST_F(SessionTest, TranslateAddresses)
{
  ASSERT_TRUE(session_.defineSystem(args_, config_));
  ASSERT_TRUE(session_.configureSystem(args_));
  ASSERT_TRUE(session_.run(args_));

  std::ostringstream out;
  EXPECT_FALSE(session_.translateAddresses({0x1800, 0x900'0000}, out));

  std::string text = out.str();
  EXPECT_NE(text.find("guest 1 ipa 0x0000001800 -> hpa 0x0080001800 2M rwx normal-wb"),
            std::string::npos);
  EXPECT_NE(text.find("guest 1 ipa 0x0009000000 -> hpa 0x0009000000 4K rw- device"),
            std::string::npos);
  EXPECT_NE(text.find("guest 2 ipa 0x0000001800 fault translation-fault level 3"),
            std::string::npos);
  EXPECT_NE(text.find("guest 2 ipa 0x0009000000 fault translation-fault"),
            std::string::npos);
}


TEST_F(SessionTest, InvalidConfig)
{
  HvConfig bad;
  ASSERT_TRUE(bad.loadConfigString(R"({ "page_table_pool": { "tables": 0 } })"));
  EXPECT_FALSE(session_.defineSystem(args_, bad));
  EXPECT_FALSE(session_.configureSystem(args_));
}


TEST_F(SessionTest, OverlappingRegions)
{
  HvConfig overlap;
  ASSERT_TRUE(overlap.loadConfigString(R"({
      "guests": [ { "memory": [
        { "ipa": "0x0", "hpa": "0x80000000", "size": "0x2000" },
        { "ipa": "0x1000", "hpa": "0x90000000", "size": "0x1000" } ] } ] })"));
  ASSERT_TRUE(session_.defineSystem(args_, overlap));
  EXPECT_FALSE(session_.configureSystem(args_));
}
