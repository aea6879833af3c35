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

#include <iostream>
#include <span>
#include "HvConfig.hpp"
#include "Args.hpp"
#include "Session.hpp"


using namespace ArmHyp;


int
main(int argc, char* argv[])
{
  bool ok = true;
  try
    {
      Args args;
      if (not args.parseCmdLineArgs(std::span(argv, argc)))
        return 1;
      if (args.help or args.version)
        return 0;

      // Load configuration file.
      HvConfig config;
      if (not config.loadConfigFile(args.configFile))
        return 1;

      Session session{};
      ok = session.defineSystem(args, config);
      ok = ok and session.configureSystem(args);
      ok = ok and session.run(args);
    }
  catch (std::exception& e)
    {
      std::cerr << e.what() << '\n';
      ok = false;
    }

  return ok ? 0 : 1;
}
