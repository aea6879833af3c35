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


namespace ArmHyp
{

  /// Structure used to unpack/pack the fields of the HCR_EL2 register.
  union HcrFields
  {
    HcrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;  // HCR_EL2 register value
    struct
    {
      uint64_t VM       : 1;   // Stage-2 translation enable
      uint64_t SWIO     : 1;
      uint64_t PTW      : 1;
      uint64_t FMO      : 1;   // FIQ routing, must be clear
      uint64_t res0     : 5;
      uint64_t INST_OVR : 1;   // Lower-level instruction accesses go through stage 2
      uint64_t DATA_OVR : 1;   // Lower-level data accesses go through stage 2
      uint64_t DC_OVR   : 1;   // Default-cacheable override
      uint64_t res1     : 20;
      uint64_t CD       : 1;   // Stage-2 cache disable, must be clear
      uint64_t res2     : 31;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of the VTCR_EL2 register.
  union VtcrFields
  {
    VtcrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;  // VTCR_EL2 register value
    struct
    {
      uint64_t T0SZ  : 6;   // Input address size is 64 - T0SZ
      uint64_t SL0   : 2;   // Starting level
      uint64_t IRGN0 : 2;   // Inner cacheability of table walks
      uint64_t ORGN0 : 2;   // Outer cacheability of table walks
      uint64_t SH0   : 2;   // Shareability of table walks
      uint64_t TG0   : 2;   // Granule
      uint64_t PS    : 3;   // Physical address size
      uint64_t res   : 45;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of the VTTBR_EL2 register.
  union VttbrFields
  {
    VttbrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;  // VTTBR_EL2 register value
    struct
    {
      uint64_t CNP   : 1;
      uint64_t res0  : 11;
      uint64_t BADDR : 36;  // Table root address bits 47:12
      uint64_t res1  : 8;
      uint64_t VMID  : 8;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of the SCTLR_EL2 register.
  union SctlrFields
  {
    SctlrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;  // SCTLR_EL2 register value
    struct
    {
      uint64_t M    : 1;   // MMU enable
      uint64_t A    : 1;   // Alignment check
      uint64_t C    : 1;   // Data cache enable
      uint64_t SA   : 1;   // Stack alignment check
      uint64_t res0 : 8;
      uint64_t I    : 1;   // Instruction cache enable
      uint64_t res1 : 6;
      uint64_t WXN  : 1;   // Write implies execute-never
      uint64_t res2 : 5;
      uint64_t EE   : 1;
      uint64_t res3 : 38;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of the CPTR_EL2 register.
  union CptrFields
  {
    CptrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;  // CPTR_EL2 register value
    struct
    {
      uint64_t res0  : 10;
      uint64_t TFP   : 1;   // Trap FP/SIMD
      uint64_t res1  : 9;
      uint64_t TTA   : 1;
      uint64_t res2  : 10;
      uint64_t TCPAC : 1;
      uint64_t res3  : 32;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of a timer control
  /// register (CNTV_CTL_EL0, CNTHP_CTL_EL2).
  union TimerCtlFields
  {
    TimerCtlFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;
    struct
    {
      uint64_t ENABLE  : 1;
      uint64_t IMASK   : 1;
      uint64_t ISTATUS : 1;   // Read only, set by hardware
      uint64_t res     : 61;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of the CNTHCTL_EL2 register.
  union CnthctlFields
  {
    CnthctlFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;
    struct
    {
      uint64_t EL1PCTEN : 1;  // EL1 physical counter access
      uint64_t EL1PCEN  : 1;  // EL1 physical timer access
      uint64_t res      : 62;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of ESR_EL2.
  union EsrFields
  {
    EsrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;  // ESR_EL2 register value
    struct
    {
      uint64_t ISS  : 25;  // Instruction specific syndrome
      uint64_t IL   : 1;   // 32-bit instruction
      uint64_t EC   : 6;   // Exception class
      uint64_t ISS2 : 5;
      uint64_t res  : 27;
    } bits_;
  };


  /// Structure used to unpack the ISS of a data or instruction abort.
  union AbortIssFields
  {
    AbortIssFields(uint32_t value = 0)
      : value_(value)
    { }

    uint32_t value_;
    struct
    {
      unsigned FSC   : 6;   // Fault status code
      unsigned WNR   : 1;   // Write not read
      unsigned S1PTW : 1;   // Fault on stage-1 table walk
      unsigned CM    : 1;
      unsigned EA    : 1;
      unsigned FNV   : 1;   // FAR not valid
      unsigned SET   : 2;
      unsigned VNCR  : 1;
      unsigned AR    : 1;
      unsigned SF    : 1;
      unsigned SRT   : 5;
      unsigned SSE   : 1;
      unsigned SAS   : 2;
      unsigned ISV   : 1;
      unsigned res   : 7;
    } bits_;
  };


  /// Structure used to unpack HPFAR_EL2.
  union HpfarFields
  {
    HpfarFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;
    struct
    {
      uint64_t res0 : 4;
      uint64_t FIPA : 40;   // Faulting IPA bits 51:12
      uint64_t res1 : 20;
    } bits_;
  };


  /// Structure used to unpack/pack the fields of a saved program
  /// status register (SPSR_EL2) and of the DAIF register.
  union SpsrFields
  {
    SpsrFields(uint64_t value = 0)
      : value_(value)
    { }

    uint64_t value_;
    struct
    {
      uint64_t M    : 4;   // Exception level and stack selector
      uint64_t M4   : 1;   // AArch32 state
      uint64_t res0 : 1;
      uint64_t F    : 1;   // FIQ mask
      uint64_t I    : 1;   // IRQ mask
      uint64_t A    : 1;   // SError mask
      uint64_t D    : 1;   // Debug mask
      uint64_t res1 : 18;
      uint64_t V    : 1;
      uint64_t C    : 1;
      uint64_t Z    : 1;
      uint64_t N    : 1;
      uint64_t res2 : 32;
    } bits_;
  };

}
