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

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include "HvConfig.hpp"


using namespace ArmHyp;


HvConfig::HvConfig()
  : config_(std::make_unique<nlohmann::json>())
{
}


HvConfig::~HvConfig() = default;


bool
HvConfig::loadConfigFile(const std::string& filePath)
{
  std::ifstream ifs(filePath);
  if (not ifs.good())
    {
      std::cerr << "Error: Failed to open config file '" << filePath
                << "' for input.\n";
      return false;
    }

  try
    {
      // Use json::parse rather than operator>> to allow comments to be ignored
      *config_ = nlohmann::json::parse(ifs, nullptr /* callback */, true /* allow_exceptions */, true /* ignore_comments */);
    }
  catch (std::exception& e)
    {
      std::cerr << "Error: Config file '" << filePath << "': " << e.what() << "\n";
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Error: Config file '" << filePath << "' does not hold a JSON object\n";
      config_->clear();
      return false;
    }

  return true;
}


bool
HvConfig::loadConfigString(std::string_view text)
{
  try
    {
      *config_ = nlohmann::json::parse(text, nullptr, true, true);
    }
  catch (std::exception& e)
    {
      std::cerr << "Error: Invalid configuration: " << e.what() << "\n";
      return false;
    }

  if (not config_->is_object())
    {
      std::cerr << "Error: Configuration is not a JSON object\n";
      config_->clear();
      return false;
    }

  return true;
}


void
HvConfig::clear()
{
  config_ = std::make_unique<nlohmann::json>();
}


namespace ArmHyp
{

  /// Convert given json entry to an unsigned integer value honoring
  /// hexadecimal prefix (0x) if any. Return true on succes and false
  /// if given entry does not represent an integer.
  template <typename UINT>
  bool
  getJsonUnsigned(std::string_view tag, const nlohmann::json& js, UINT& value)
  {
    value = 0;

    if (js.is_number_unsigned() or (js.is_number_integer() and js.get<int64_t>() >= 0))
      {
        uint64_t u64 = js.get<uint64_t>();
        value = static_cast<UINT>(u64);
        if (value != u64)
          {
            std::cerr << "Error: Overflow in config file value for '" << tag << "': "
                      << u64 << '\n';
            return false;
          }
        return true;
      }

    if (js.is_string())
      {
        char*            end = nullptr;
        std::string      str = js.get<std::string>();
        uint64_t         u64 = strtoull(str.c_str(), &end, 0);
        if (str.empty() or (end and *end))
          {
            std::cerr << "Error: Invalid config file unsigned value for '" << tag << "': "
                      << str << '\n';
            return false;
          }
        value = static_cast<UINT>(u64);
        if (value != u64)
          {
            std::cerr << "Error: Overflow in config file value for '" << tag << "': "
                      << str << '\n';
            return false;
          }

        return true;
      }

    std::cerr << "Error: Config file entry '" << tag << "' must contain a non-negative integer\n";
    return false;
  }


  /// Convert given json entry to a boolean value. Return ture on
  /// success and false on failure.
  bool
  getJsonBoolean(std::string_view tag, const nlohmann::json& js, bool& value)
  {
    value = false;

    if (js.is_boolean())
      {
        value = js.get<bool>();
        return true;
      }

    if (js.is_number())
      {
        value = js.get<unsigned>() != 0;
        return true;
      }

    if (js.is_string())
      {
        std::string str = js.get<std::string>();
        if (str == "0" or str == "false" or str == "False")
          value = false;
        else if (str == "1" or str == "true" or str == "True")
          value = true;
        else
          {
            std::cerr << "Error: Invalid config file boolean value for '" << tag << "': "
                      << str << '\n';
            return false;
          }
        return true;
      }

    std::cerr << "Error: Config file entry '" << tag << "' must contain a bool\n";
    return false;
  }

}


bool
ArmHyp::parseMapAttrs(std::string_view text, MapAttrs& attrs)
{
  attrs.read = attrs.write = attrs.exec = false;
  for (char c : text)
    {
      switch (c)
        {
        case 'r': attrs.read = true; break;
        case 'w': attrs.write = true; break;
        case 'x': attrs.exec = true; break;
        case '-': break;
        default: return false;
        }
    }
  return true;
}


bool
ArmHyp::parseMemoryType(std::string_view text, MemoryType& type)
{
  for (auto candidate : { MemoryType::Device, MemoryType::NormalWriteBack,
                          MemoryType::NormalWriteThrough, MemoryType::NormalNonCacheable })
    if (to_string(candidate) == text)
      {
        type = candidate;
        return true;
      }
  return false;
}


static
bool
applyStage2Config(const nlohmann::json& conf, Stage2Config& stage2)
{
  unsigned errors = 0;

  if (conf.contains("ipa_bits"))
    {
      unsigned bits = 0;
      if (not getJsonUnsigned("stage2.ipa_bits", conf.at("ipa_bits"), bits))
        errors++;
      else if (bits < 25 or bits > 48)
        {
          std::cerr << "Error: Config file stage2.ipa_bits must be between 25 and 48: "
                    << bits << '\n';
          errors++;
        }
      else
        stage2.t0sz = 64 - bits;
    }

  if (conf.contains("start_level"))
    {
      unsigned level = 0;
      if (not getJsonUnsigned("stage2.start_level", conf.at("start_level"), level))
        errors++;
      else if (level > 2)
        {
          std::cerr << "Error: Config file stage2.start_level must be 0, 1 or 2: "
                    << level << '\n';
          errors++;
        }
      else
        stage2.sl0 = 2 - level;
    }

  if (conf.contains("granule"))
    {
      const auto& gr = conf.at("granule");
      bool ok = ((gr.is_string() and (gr.get<std::string>() == "4k" or gr.get<std::string>() == "4K"))
                 or (gr.is_number_unsigned() and gr.get<uint64_t>() == 4096));
      if (not ok)
        {
          std::cerr << "Error: Config file stage2.granule: only 4k is supported\n";
          errors++;
        }
      else
        stage2.tg = 0;
    }

  if (conf.contains("pa_bits"))
    {
      unsigned bits = 0;
      if (not getJsonUnsigned("stage2.pa_bits", conf.at("pa_bits"), bits))
        errors++;
      else if (not Stage2Config::psForBits(bits, stage2.ps))
        {
          std::cerr << "Error: Config file stage2.pa_bits must be 32, 40 or 48: "
                    << bits << '\n';
          errors++;
        }
    }

  struct Field { std::string_view tag; unsigned& value; };
  for (Field field : { Field{"shareability", stage2.sh}, Field{"inner_cache", stage2.irgn},
                       Field{"outer_cache", stage2.orgn} })
    {
      if (not conf.contains(field.tag))
        continue;
      unsigned value = 0;
      std::string tag = "stage2." + std::string(field.tag);
      if (not getJsonUnsigned(tag, conf.at(field.tag), value))
        errors++;
      else if (value > 3)
        {
          std::cerr << "Error: Config file " << tag << " must be between 0 and 3: "
                    << value << '\n';
          errors++;
        }
      else
        field.value = value;
    }

  return errors == 0;
}


static
bool
applyTimerConfig(const nlohmann::json& conf, HvParams& params)
{
  unsigned errors = 0;
  PlatformInfo& platform = params.platform;

  if (conf.contains("frequency"))
    {
      if (not getJsonUnsigned("timer.frequency", conf.at("frequency"), platform.counterFrequency))
        errors++;
      else if (platform.counterFrequency == 0)
        {
          std::cerr << "Error: Config file timer.frequency must not be zero\n";
          errors++;
        }
    }

  if (conf.contains("virtual_irq") and
      not getJsonUnsigned("timer.virtual_irq", conf.at("virtual_irq"), platform.virtualTimerIrq))
    errors++;

  if (conf.contains("hyp_irq") and
      not getJsonUnsigned("timer.hyp_irq", conf.at("hyp_irq"), platform.hypTimerIrq))
    errors++;

  if (conf.contains("phys_irq") and
      not getJsonUnsigned("timer.phys_irq", conf.at("phys_irq"), platform.physTimerIrq))
    errors++;

  if (conf.contains("slice_us") and
      not getJsonUnsigned("timer.slice_us", conf.at("slice_us"), params.sliceUs))
    errors++;

  if (platform.hypTimerIrq == platform.physTimerIrq)
    {
      std::cerr << "Error: Config file timer.hyp_irq and timer.phys_irq must differ\n";
      errors++;
    }

  return errors == 0;
}


static
bool
applyMemoryRegion(const std::string& path, const nlohmann::json& conf, MemoryRegion& region)
{
  unsigned errors = 0;

  for (std::string_view tag : { "ipa", "hpa", "size" })
    if (not conf.contains(tag))
      {
        std::cerr << "Error: Config file " << path << " missing '" << tag << "'\n";
        errors++;
      }
  if (errors)
    return false;

  if (not getJsonUnsigned(path + ".ipa", conf.at("ipa"), region.ipa))
    errors++;
  if (not getJsonUnsigned(path + ".hpa", conf.at("hpa"), region.hpa))
    errors++;
  if (not getJsonUnsigned(path + ".size", conf.at("size"), region.size))
    errors++;

  if (conf.contains("attrs"))
    {
      const auto& attrs = conf.at("attrs");
      if (not attrs.is_string() or not parseMapAttrs(attrs.get<std::string>(), region.attrs))
        {
          std::cerr << "Error: Config file " << path << ".attrs must be a string made of r, w, x and -\n";
          errors++;
        }
    }

  if (conf.contains("type"))
    {
      const auto& type = conf.at("type");
      if (not type.is_string() or not parseMemoryType(type.get<std::string>(), region.attrs.type))
        {
          std::cerr << "Error: Config file " << path << ".type must be one of device, "
                    << "normal-wb, normal-wt, normal-nc\n";
          errors++;
        }
    }

  if (conf.contains("lazy") and not getJsonBoolean(path + ".lazy", conf.at("lazy"), region.lazy))
    errors++;

  return errors == 0;
}


static
bool
applyGuestConfig(const nlohmann::json& conf, std::vector<GuestParams>& guests)
{
  if (not conf.is_array())
    {
      std::cerr << "Error: Config file guests must be an array\n";
      return false;
    }

  unsigned errors = 0;
  guests.clear();

  for (unsigned gix = 0; gix < conf.size(); ++gix)
    {
      const auto& entry = conf.at(gix);
      std::string path = "guests[" + std::to_string(gix) + "]";
      GuestParams guest;

      if (entry.contains("vcpus"))
        {
          if (not getJsonUnsigned(path + ".vcpus", entry.at("vcpus"), guest.vcpus))
            errors++;
          else if (guest.vcpus == 0)
            {
              std::cerr << "Error: Config file " << path << ".vcpus must not be zero\n";
              errors++;
            }
        }

      if (entry.contains("memory"))
        {
          const auto& mem = entry.at("memory");
          if (not mem.is_array())
            {
              std::cerr << "Error: Config file " << path << ".memory must be an array\n";
              errors++;
            }
          else
            for (unsigned mix = 0; mix < mem.size(); ++mix)
              {
                MemoryRegion region;
                std::string mpath = path + ".memory[" + std::to_string(mix) + "]";
                if (applyMemoryRegion(mpath, mem.at(mix), region))
                  guest.memory.push_back(region);
                else
                  errors++;
              }
        }

      guests.push_back(guest);
    }

  return errors == 0;
}


bool
HvConfig::getCoreCount(unsigned& count) const
{
  if (config_ -> contains("cores"))
    return getJsonUnsigned("cores", config_ -> at("cores"), count);
  return false;
}


bool
HvConfig::applyConfig(HvParams& params) const
{
  unsigned errors = 0;

  if (config_ -> contains("cores"))
    {
      unsigned cores = 0;
      if (not getCoreCount(cores))
        errors++;
      else if (cores == 0)
        {
          std::cerr << "Error: Config file cores must not be zero\n";
          errors++;
        }
      else
        params.cores = cores;
    }

  if (config_ -> contains("stage2") and
      not applyStage2Config(config_ -> at("stage2"), params.el2.stage2))
    errors++;

  if (config_ -> contains("el2"))
    {
      const auto& el2 = config_ -> at("el2");
      if (el2.contains("alignment_check") and
          not getJsonBoolean("el2.alignment_check", el2.at("alignment_check"),
                             params.el2.alignmentCheck))
        errors++;
      if (el2.contains("wxn") and
          not getJsonBoolean("el2.wxn", el2.at("wxn"), params.el2.wxn))
        errors++;
      if (el2.contains("mair") and
          not getJsonUnsigned("el2.mair", el2.at("mair"), params.el2.mair))
        errors++;
    }

  if (config_ -> contains("timer") and not applyTimerConfig(config_ -> at("timer"), params))
    errors++;

  if (config_ -> contains("page_table_pool"))
    {
      const auto& pool = config_ -> at("page_table_pool");
      if (pool.contains("base"))
        {
          if (not getJsonUnsigned("page_table_pool.base", pool.at("base"), params.poolBase))
            errors++;
          else if ((params.poolBase & 0xfff) != 0)
            {
              std::cerr << "Error: Config file page_table_pool.base must be 4k aligned\n";
              errors++;
            }
        }
      if (pool.contains("tables"))
        {
          if (not getJsonUnsigned("page_table_pool.tables", pool.at("tables"), params.poolTables))
            errors++;
          else if (params.poolTables == 0)
            {
              std::cerr << "Error: Config file page_table_pool.tables must not be zero\n";
              errors++;
            }
        }
    }

  if (config_ -> contains("guests") and
      not applyGuestConfig(config_ -> at("guests"), params.guests))
    errors++;

  return errors == 0;
}
