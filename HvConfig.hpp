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
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "El2Bootstrap.hpp"
#include "Stage2Pte.hpp"
#include "Timer.hpp"

namespace ArmHyp
{

  /// Guest-physical region of a configured guest.
  struct MemoryRegion
  {
    uint64_t ipa = 0;
    uint64_t hpa = 0;
    uint64_t size = 0;
    MapAttrs attrs;
    bool lazy = false;   // Backed on first touch
  };


  /// Configured guest.
  struct GuestParams
  {
    unsigned vcpus = 1;
    std::vector<MemoryRegion> memory;
  };


  /// Parameters of a simulated system, defaults unless overridden by a
  /// configuration file.
  struct HvParams
  {
    unsigned cores = 1;
    El2Options el2;
    PlatformInfo platform;
    uint64_t sliceUs = 10'000;
    uint64_t poolBase = 0x4000'0000;
    unsigned poolTables = 4096;
    std::vector<GuestParams> guests;
  };


  /// Manage loading of configuration file and applying it to the
  /// parameters of a simulated system.
  class HvConfig
  {
  public:

    HvConfig();

    ~HvConfig();

    /// Load given configuration file (JSON file, comments allowed) into
    /// this object. Return true on success and false if file cannot be
    /// opened or if the file does not contain a valid JSON object.
    bool loadConfigFile(const std::string& filePath);

    /// Same as loadConfigFile but the JSON text is given directly.
    bool loadConfigString(std::string_view text);

    /// Apply the loaded configuration on top of params. Keys that are
    /// absent keep the values already in params. Return true on success
    /// and false if some value is invalid (all invalid values are
    /// reported).
    bool applyConfig(HvParams& params) const;

    /// Set count to the number of cores. Return false if the
    /// configuration does not specify it.
    bool getCoreCount(unsigned& count) const;

    /// Clear previously loaded configuration.
    void clear();

  private:

    HvConfig(const HvConfig&) = delete;
    void operator= (const HvConfig&) = delete;

    std::unique_ptr<nlohmann::json> config_;
  };


  /// Set attrs from a permission string such as "rwx" or "r-x". Return
  /// false if the string holds other characters.
  bool parseMapAttrs(std::string_view text, MapAttrs& attrs);

  /// Set type from a memory type name (see to_string(MemoryType)).
  /// Return false if no such type.
  bool parseMemoryType(std::string_view text, MemoryType& type);

}
