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

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "Args.hpp"

using namespace ArmHyp;


namespace
{

  bool
  parse(std::vector<std::string> words, Args& args)
  {
    words.insert(words.begin(), "armhyp");
    return args.parseCmdLineArgs(words);
  }

}


TEST(ArgsTest, ConfigOnly)
{
  Args args;
  ASSERT_TRUE(parse({"--config", "sys.json"}, args));
  EXPECT_EQ(args.configFile, "sys.json");
  EXPECT_FALSE(args.cores.has_value());
  EXPECT_FALSE(args.tlbSize.has_value());
  EXPECT_FALSE(args.sliceUs.has_value());
  EXPECT_FALSE(args.trace);
  EXPECT_FALSE(args.dumpTables);
  EXPECT_TRUE(args.translateAddrs.empty());
}


TEST(ArgsTest, PositionalConfig)
{
  Args args;
  ASSERT_TRUE(parse({"sys.json", "-l"}, args));
  EXPECT_EQ(args.configFile, "sys.json");
  EXPECT_TRUE(args.trace);
}


TEST(ArgsTest, AllOptions)
{
  Args args;
  ASSERT_TRUE(parse({"-c", "sys.json", "--cores", "4", "--tlbsize", "1k", "--slice", "0x100",
                     "--trace", "--dump-tables", "-v", "-t", "0x1000, 0x1800,,4096"}, args));
  EXPECT_EQ(args.cores.value(), 4u);
  EXPECT_EQ(args.tlbSize.value(), 1024u);
  EXPECT_EQ(args.sliceUs.value(), 0x100u);
  EXPECT_TRUE(args.trace);
  EXPECT_TRUE(args.dumpTables);
  EXPECT_TRUE(args.verbose);
  EXPECT_EQ(args.translateAddrs, (Args::Uint64Vec{0x1000, 0x1800, 4096}));
}


TEST(ArgsTest, MissingConfig)
{
  Args args;
  EXPECT_FALSE(parse({"--cores", "2"}, args));
}


TEST(ArgsTest, HelpNeedsNoConfig)
{
  Args args;
  EXPECT_TRUE(parse({"--help"}, args));
  EXPECT_TRUE(args.help);
}


TEST(ArgsTest, BadValues)
{
  {
    Args args;
    EXPECT_FALSE(parse({"sys.json", "--cores", "0"}, args));
  }
  {
    Args args;
    EXPECT_FALSE(parse({"sys.json", "--tlbsize", "0"}, args));
  }
  {
    Args args;
    EXPECT_FALSE(parse({"sys.json", "--slice", "12us"}, args));
  }
  {
    Args args;
    EXPECT_FALSE(parse({"sys.json", "--translate", "0x1000,zz"}, args));
  }
  {
    Args args;
    EXPECT_FALSE(parse({"sys.json", "--no-such-option"}, args));
  }
}


TEST(ArgsTest, NumberSuffixes)
{
  uint64_t value = 0;
  ASSERT_TRUE(Args::parseCmdLineNumber<uint64_t>("size", "4k", value));
  EXPECT_EQ(value, 4096u);
  ASSERT_TRUE(Args::parseCmdLineNumber<uint64_t>("size", "2M", value));
  EXPECT_EQ(value, 2u * 1024 * 1024);
  ASSERT_TRUE(Args::parseCmdLineNumber<uint64_t>("size", "0x10g", value));
  EXPECT_EQ(value, uint64_t(16) << 30);
  ASSERT_TRUE(Args::parseCmdLineNumber<uint64_t>("size", "010", value));
  EXPECT_EQ(value, 8u);

  EXPECT_FALSE(Args::parseCmdLineNumber<uint64_t>("size", "", value));
  EXPECT_FALSE(Args::parseCmdLineNumber<uint64_t>("size", "k", value));
  EXPECT_FALSE(Args::parseCmdLineNumber<uint64_t>("size", "0xfffffffffffffffk", value));

  unsigned small = 0;
  EXPECT_FALSE(Args::parseCmdLineNumber<unsigned>("cores", "0x100000000", small));
}
