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
#include "GasidAllocator.hpp"
#include "trapEnums.hpp"

namespace ArmHyp
{

  /// Decoded stage-2 data or instruction abort taken from a lower
  /// exception level.
  struct AbortInfo
  {
    ExceptionClass ec = ExceptionClass::UNKNOWN;
    FaultKind kind = FaultKind::None;
    unsigned level = 0;        // Translation level of the fault
    uint64_t ipa = 0;          // Faulting guest-physical address
    bool ipaValid = false;     // False if HPFAR/FAR did not hold the address
    bool write = false;        // Write access (data aborts only)
    bool instruction = false;  // Instruction fetch
    bool s1ptw = false;        // Fault on a stage-1 table walk
    unsigned fsc = 0;          // Raw fault status code
  };


  /// Report of a guest-physical fault the hypervisor could not resolve.
  struct GuestMemoryError
  {
    Gasid gasid = 0;
    uint64_t ipa = 0;
    FaultKind kind = FaultKind::None;
    unsigned level = 0;
    bool write = false;
  };


  /// Classify the given fault status code setting level to the
  /// translation level it names (0 when the code carries no level).
  FaultKind classifyFsc(unsigned fsc, unsigned& level);

  /// Decode the syndrome of an abort taken to EL2. The faulting IPA is
  /// HPFAR_EL2.FIPA shifted into place plus the page offset taken from
  /// FAR_EL2. Return InvalidArgument if esr is not a data or
  /// instruction abort from a lower exception level.
  HvError decodeAbort(uint64_t esr, uint64_t far, uint64_t hpfar, AbortInfo& info);

  /// Return a one-line human readable description of the given abort.
  std::string describeFault(const AbortInfo& info);

  /// Return the name of the given fault kind.
  constexpr std::string_view
  to_string(FaultKind kind)
  {
    switch (kind)
      {
      case FaultKind::None:        return "none";
      case FaultKind::AddressSize: return "address-size";
      case FaultKind::Translation: return "translation";
      case FaultKind::AccessFlag:  return "access-flag";
      case FaultKind::Permission:  return "permission";
      case FaultKind::Alignment:   return "alignment";
      case FaultKind::TlbConflict: return "tlb-conflict";
      case FaultKind::Other:       return "other";
      }
    return "?";
  }
}
