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

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <type_traits>
#include <boost/algorithm/string.hpp>
#include "Args.hpp"


using namespace ArmHyp;


static
void
printVersion()
{
  unsigned version = 1;
  unsigned subversion = 0;
  std::cout << "Version " << version << "." << subversion << " compiled on "
            << __DATE__ << " at " << __TIME__ << '\n';
#ifdef GIT_SHA
  #define xstr(x) str(x)
  #define str(x) #x
  std::cout << "Git SHA: " << xstr(GIT_SHA) << '\n';
  #undef str
  #undef xstr
#endif
  std::cout << "Compile options: \n";
#ifdef ARMHYP_AARCH64_BACKEND
  std::cout << "ARMHYP_AARCH64_BACKEND\n";
#endif
}


bool
Args::collectCommandLineValues(const boost::program_options::variables_map& varMap)
{
  bool ok = true;

  if (varMap.count("cores"))
    {
      auto numStr = varMap["cores"].as<std::string>();
      if (not parseCmdLineNumber("cores", numStr, this->cores))
        ok = false;
      else if (this->cores.has_value() and *this->cores == 0)
        {
          std::cerr << "Error: Core count must not be zero\n";
          ok = false;
        }
    }

  if (varMap.count("tlbsize"))
    {
      auto numStr = varMap["tlbsize"].as<std::string>();
      if (not parseCmdLineNumber("tlbsize", numStr, this->tlbSize))
        ok = false;
      else if (this->tlbSize.has_value() and *this->tlbSize == 0)
        {
          std::cerr << "Error: TLB size must not be zero\n";
          ok = false;
        }
    }

  if (varMap.count("slice"))
    {
      auto numStr = varMap["slice"].as<std::string>();
      if (not parseCmdLineNumber("slice", numStr, this->sliceUs))
        ok = false;
    }

  if (not this->translateList.empty())
    {
      StringVec tokens;
      boost::split(tokens, this->translateList, boost::is_any_of(","),
                   boost::token_compress_on);
      this->translateAddrs.clear();
      for (auto& token : tokens)
        {
          boost::trim(token);
          if (token.empty())
            continue;
          uint64_t addr = 0;
          if (not parseCmdLineNumber("translate", token, addr))
            ok = false;
          else
            this->translateAddrs.push_back(addr);
        }
    }

  if (this->configFile.empty())
    {
      std::cerr << "Error: Missing --config option\n";
      ok = false;
    }

  return ok;
}


bool
Args::parseCmdLineArgs(std::span<char*> argv)
{
  try
    {
      // Define command line options.
      namespace po = boost::program_options;
      po::options_description desc("options");
      desc.add_options()
        ("help,h", po::bool_switch(&this->help),
         "Produce this message.")
        ("config,c", po::value(&this->configFile),
         "Configuration file (JSON) describing the platform and the guests.")
        ("cores", po::value<std::string>(),
         "Number of simulated physical cores, overrides the configuration file.")
        ("tlbsize", po::value<std::string>(),
         "Number of entries of the simulated stage-2 TLB (default 256).")
        ("slice", po::value<std::string>(),
         "Length in microseconds of a VCPU execution slice, overrides the "
         "configuration file.")
        ("trace,l", po::bool_switch(&this->trace),
         "Trace to standard error stage-2 table updates, fault handling and timer "
         "interrupt injection.")
        ("dump-tables", po::bool_switch(&this->dumpTables),
         "Print the stage-2 translation tables of every guest, the TLB contents and "
         "the saved registers of every VCPU.")
        ("translate,t", po::value(&this->translateList),
         "Comma separated list of guest-physical addresses to translate in every "
         "guest. Example: --translate 0x1000,0x1800")
        ("verbose,v", po::bool_switch(&this->verbose),
         "Be verbose.")
        ("version", po::bool_switch(&this->version),
         "Print version.");

      // Define positional options.
      po::positional_options_description pdesc;
      pdesc.add("config", 1);

      // Parse command line options.
      po::variables_map varMap;
      po::command_line_parser parser(static_cast<int>(argv.size()), argv.data());
      auto parsed = parser.options(desc).positional(pdesc).run();
      po::store(parsed, varMap);
      po::notify(varMap);

      bool earlyExit = false;
      if (this->version)
        {
          printVersion();
          earlyExit = true;
        }

      if (this->help)
        {
          std::cout <<
            "Bring up simulated ARM64 cores in hypervisor mode, create the guests\n"
            "described by the configuration file, map their memory, switch each of\n"
            "their virtual CPUs in and out once and translate the requested guest-physical\n"
            "addresses. All numeric arguments are interpreted as hexadecimal numbers\n"
            "when prefixed with 0x.\n"
            "Examples:\n"
            "  armhyp --config config/sample.json\n"
            "  armhyp --config config/sample.json --trace --translate 0x1000,0x1800\n\n";
          std::cout << desc;
          earlyExit = true;
        }

      if (earlyExit)
        return true;

      if (not this->collectCommandLineValues(varMap))
        return false;
    }

  catch (std::exception& exp)
    {
      std::cerr << "Failed to parse command line args: " << exp.what() << '\n';
      return false;
    }

  return true;
}


template <typename TYPE>
bool
Args::parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                         TYPE& number)
{
  std::string str = numberStr;
  bool good = not str.empty();
  uint64_t scale = 1;
  if (good)
    {
      char suffix = static_cast<char>(std::tolower(str.back()));
      if (suffix == 'k')
        scale = 1024;
      else if (suffix == 'm')
        scale = UINT64_C(1024)*1024;
      else if (suffix == 'g')
        scale = UINT64_C(1024)*1024*1024;
      if (scale != 1)
        {
          str = str.substr(0, str.length() - 1);
          if (str.empty())
            good = false;
        }
    }

  if (good)
    {
      char* end = nullptr;
      uint64_t val = strtoull(str.c_str(), &end, 0);
      uint64_t scaled = val * scale;
      number = static_cast<TYPE>(scaled);
      if ((scale != 1 and scaled / scale != val) or scaled != number)
        {
          std::cerr << "parseCmdLineNumber: Number too large: " << numberStr
                    << '\n';
          return false;
        }
      if (end and *end)
        good = false;  // Part of the string are non parseable.
    }

  if (not good)
    std::cerr << "Invalid command line " << option << " value: " << numberStr
              << '\n';
  return good;
}


template <typename TYPE>
bool
Args::parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                         std::optional<TYPE>& number)
{
  TYPE n;
  if (not parseCmdLineNumber(option, numberStr, n))
    return false;
  number = n;
  return true;
}


template bool Args::parseCmdLineNumber(const std::string&, const std::string&, uint64_t&);
template bool Args::parseCmdLineNumber(const std::string&, const std::string&, unsigned&);
