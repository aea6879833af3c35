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
#include <string_view>

namespace ArmHyp
{

  /// Exception level, least to most privileged.
  enum class PrivilegeLevel : uint32_t
    {
      El0 = 0,  // Application
      El1 = 1,  // Guest kernel
      El2 = 2,  // Hypervisor
      El3 = 3   // Secure monitor
    };


  /// Exception class: bits 31:26 of ESR_EL2.
  enum class ExceptionClass : uint32_t
    {
      UNKNOWN          = 0x00,
      WFX              = 0x01,  // WFI or WFE trapped
      FP_ACCESS        = 0x07,  // FP/SIMD access trapped by CPTR_EL2.TFP
      HVC64            = 0x16,
      SMC64            = 0x17,
      SYSREG           = 0x18,  // MSR/MRS trapped
      INST_ABORT_LOWER = 0x20,  // Instruction abort from a lower level
      INST_ABORT_SAME  = 0x21,
      DATA_ABORT_LOWER = 0x24,  // Data abort from a lower level
      DATA_ABORT_SAME  = 0x25
    };


  /// Classification of a stage-2 translation fault.
  enum class FaultKind : uint32_t
    {
      None        = 0,
      AddressSize = 1,
      Translation = 2,
      AccessFlag  = 3,
      Permission  = 4,
      Alignment   = 5,
      TlbConflict = 6,
      Other       = 7
    };


  /// Error codes reported by the hypervisor core. None denotes success.
  enum class HvError : uint32_t
    {
      None,
      WrongPrivilegeLevel,     // Bootstrap not running at EL2
      GasidExhausted,          // All 255 guest address-space ids in use
      UnalignedAddress,        // Address or size not granule aligned
      OverlappingMapping,      // Target range already has a valid mapping
      TableAllocationFailure,  // Page table pool exhausted
      AddressSizeFault,        // Address beyond the walkable/physical range
      TranslationFault,        // No mapping
      AccessFlagFault,         // Mapping with access flag clear
      PermissionFault,         // Mapping does not allow the access
      TimerNotInitialized,     // Timer used before its owning context set it up
      InterruptsEnabled,       // World-switch step invoked with IRQs unmasked
      InvalidArgument,         // Bad id, unknown guest, zero size ...
      NotMapped                // Diagnostic queries only
    };


  /// Return the name of the given error code.
  constexpr std::string_view
  to_string(HvError error)
  {
    switch (error)
      {
      case HvError::None:                   return "none";
      case HvError::WrongPrivilegeLevel:    return "wrong-privilege-level";
      case HvError::GasidExhausted:         return "gasid-exhausted";
      case HvError::UnalignedAddress:       return "unaligned-address";
      case HvError::OverlappingMapping:     return "overlapping-mapping";
      case HvError::TableAllocationFailure: return "table-allocation-failure";
      case HvError::AddressSizeFault:       return "address-size-fault";
      case HvError::TranslationFault:       return "translation-fault";
      case HvError::AccessFlagFault:        return "access-flag-fault";
      case HvError::PermissionFault:        return "permission-fault";
      case HvError::TimerNotInitialized:    return "timer-not-initialized";
      case HvError::InterruptsEnabled:      return "interrupts-enabled";
      case HvError::InvalidArgument:        return "invalid-argument";
      case HvError::NotMapped:              return "not-mapped";
      }
    return "unknown";
  }


  /// Map a stage-2 fault classification to the corresponding error
  /// code.
  constexpr HvError
  faultToError(FaultKind kind)
  {
    switch (kind)
      {
      case FaultKind::None:        return HvError::None;
      case FaultKind::AddressSize: return HvError::AddressSizeFault;
      case FaultKind::Translation: return HvError::TranslationFault;
      case FaultKind::AccessFlag:  return HvError::AccessFlagFault;
      case FaultKind::Permission:  return HvError::PermissionFault;
      default:                     return HvError::InvalidArgument;
      }
  }


  /// Return the name of the given privilege level.
  constexpr std::string_view
  to_string(PrivilegeLevel level)
  {
    switch (level)
      {
      case PrivilegeLevel::El0: return "EL0";
      case PrivilegeLevel::El1: return "EL1";
      case PrivilegeLevel::El2: return "EL2";
      case PrivilegeLevel::El3: return "EL3";
      }
    return "EL?";
  }
}
