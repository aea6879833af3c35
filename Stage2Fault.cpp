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
#include "Stage2Fault.hpp"
#include "SysRegFields.hpp"

using namespace ArmHyp;


FaultKind
ArmHyp::classifyFsc(unsigned fsc, unsigned& level)
{
  level = fsc & 3;

  if (fsc == 0b100001)
    {
      level = 0;
      return FaultKind::Alignment;
    }
  if (fsc == 0b110000)
    {
      level = 0;
      return FaultKind::TlbConflict;
    }

  switch (fsc >> 2)
    {
    case 0b0000: return FaultKind::AddressSize;
    case 0b0001: return FaultKind::Translation;
    case 0b0010: return FaultKind::AccessFlag;
    case 0b0011: return FaultKind::Permission;
    default:     break;
    }

  level = 0;
  return FaultKind::Other;
}


HvError
ArmHyp::decodeAbort(uint64_t esr, uint64_t far, uint64_t hpfar, AbortInfo& info)
{
  info = AbortInfo{};

  EsrFields fields(esr);
  auto ec = static_cast<ExceptionClass>(fields.bits_.EC);
  if (ec != ExceptionClass::DATA_ABORT_LOWER and ec != ExceptionClass::INST_ABORT_LOWER)
    return HvError::InvalidArgument;

  AbortIssFields iss(uint32_t(fields.bits_.ISS));

  info.ec = ec;
  info.fsc = iss.bits_.FSC;
  info.kind = classifyFsc(info.fsc, info.level);
  info.instruction = ec == ExceptionClass::INST_ABORT_LOWER;
  info.write = not info.instruction and iss.bits_.WNR;
  info.s1ptw = iss.bits_.S1PTW;

  HpfarFields hp(hpfar);
  info.ipa = (uint64_t(hp.bits_.FIPA) << 12) | (far & 0xfff);
  info.ipaValid = not iss.bits_.FNV;

  return HvError::None;
}


std::string
ArmHyp::describeFault(const AbortInfo& info)
{
  std::ostringstream oss;
  oss << (info.instruction ? "instruction" : "data") << " abort: "
      << to_string(info.kind) << " fault at level " << info.level
      << " ipa 0x" << std::hex << info.ipa << std::dec
      << (info.instruction ? " fetch" : (info.write ? " write" : " read"));
  if (info.s1ptw)
    oss << " (stage-1 walk)";
  if (not info.ipaValid)
    oss << " (address not valid)";
  oss << " fsc 0x" << std::hex << info.fsc;
  return oss.str();
}
