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
#include <string>
#include <span>
#include <optional>
#include <vector>
#include <boost/program_options.hpp>


namespace ArmHyp
{

  /// Parse/maintain arguments provided on the command line.
  struct Args
  {
    using StringVec = std::vector<std::string>;
    using Uint64Vec = std::vector<uint64_t>;

    /// Parse command line arguments and collect option values. Return true on success and
    /// false on failure.
    bool parseCmdLineArgs(std::span<char*> argv);

    /// Parse command line arguments and collect option vlaues. Return true on success and
    /// false on failure.
    bool parseCmdLineArgs(std::vector<std::string>& args)
    {
      std::vector<char*> argv;
      for (auto& arg : args)
        argv.push_back(arg.data());
      return parseCmdLineArgs(std::span(argv.data(), argv.size()));
    }

    /// Helper to parseCmdLineArgs.
    bool collectCommandLineValues(const boost::program_options::variables_map& varMap);

    /// Convert the command line string numberStr to a number using strotull and a base of
    /// zero (prefixes 0 and 0x are honored). A k, m or g suffix scales the number by 1024,
    /// 1024*1024 or 1024*1024*1024. Return true on success and false on failure (string
    /// does not represent a number). TYPE is an unsigned integer type (e.g
    /// uint32_t). Option is the command line option associated with the string and is
    /// used for diagnostic messages.
    template <typename TYPE>
    static bool
    parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                       TYPE& number);

    /// Adapter for the parseCmdLineNumber for optionals.
    template <typename TYPE>
    static bool
    parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                       std::optional<TYPE>& number);

    std::string configFile;          // Configuration (JSON) file.
    std::string translateList;       // Comma separated guest-physical addresses.
    Uint64Vec   translateAddrs;      // Parsed from translateList.

    std::optional<unsigned> cores;   // Overrides the configuration file core count.
    std::optional<uint64_t> tlbSize; // Number of entries of the simulated TLB.
    std::optional<uint64_t> sliceUs; // Overrides the configuration file slice length.

    bool help = false;
    bool trace = false;        // Trace map/unmap, faults and interrupt injection.
    bool dumpTables = false;   // Print the translation tables of every guest.
    bool verbose = false;
    bool version = false;
  };
}
