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
#include "Aarch64Cpu.hpp"
#include "SysRegFields.hpp"

using namespace ArmHyp;


#define ARMHYP_SYSREGS(X)                                               \
  X(HCR_EL2) X(VTCR_EL2) X(VTTBR_EL2) X(SCTLR_EL2) X(CPTR_EL2)          \
  X(HSTR_EL2) X(MDCR_EL2) X(MAIR_EL2) X(VPIDR_EL2) X(VMPIDR_EL2)        \
  X(ESR_EL2) X(FAR_EL2) X(HPFAR_EL2) X(ELR_EL2) X(SPSR_EL2)             \
  X(TPIDR_EL2) X(CNTHCTL_EL2) X(CNTVOFF_EL2) X(CNTHP_CTL_EL2)           \
  X(CNTHP_CVAL_EL2) X(SCTLR_EL1) X(ACTLR_EL1) X(CPACR_EL1)              \
  X(TTBR0_EL1) X(TTBR1_EL1) X(TCR_EL1) X(MAIR_EL1) X(AMAIR_EL1)         \
  X(VBAR_EL1) X(CONTEXTIDR_EL1) X(TPIDR_EL0) X(TPIDRRO_EL0)             \
  X(TPIDR_EL1) X(ESR_EL1) X(FAR_EL1) X(AFSR0_EL1) X(AFSR1_EL1)          \
  X(PAR_EL1) X(SP_EL0) X(SP_EL1) X(ELR_EL1) X(SPSR_EL1) X(CSSELR_EL1)   \
  X(CNTKCTL_EL1) X(CNTV_CTL_EL0) X(CNTV_CVAL_EL0) X(DAIF) X(FPCR) X(FPSR)

#define ARMHYP_VREGS(X)                                                 \
  X(0) X(1) X(2) X(3) X(4) X(5) X(6) X(7) X(8) X(9) X(10) X(11)         \
  X(12) X(13) X(14) X(15) X(16) X(17) X(18) X(19) X(20) X(21) X(22)     \
  X(23) X(24) X(25) X(26) X(27) X(28) X(29) X(30) X(31)


uint64_t
Aarch64Cpu::readSysReg(SysReg reg)
{
  uint64_t value = 0;

  switch (reg)
    {
#define ARMHYP_MRS(name)                                        \
    case SysReg::name:                                          \
      asm volatile("mrs %0, " #name : "=r"(value));             \
      break;
      ARMHYP_SYSREGS(ARMHYP_MRS)
#undef ARMHYP_MRS

    case SysReg::CurrentEL:
      asm volatile("mrs %0, CurrentEL" : "=r"(value));
      break;

    case SysReg::CNTFRQ_EL0:
      asm volatile("mrs %0, CNTFRQ_EL0" : "=r"(value));
      break;

    case SysReg::CNTPCT_EL0:
      asm volatile("isb; mrs %0, CNTPCT_EL0" : "=r"(value) :: "memory");
      break;

    default:
      std::cerr << "Error: No such system register: " << static_cast<unsigned>(reg) << '\n';
      break;
    }

  return value;
}


void
Aarch64Cpu::writeSysReg(SysReg reg, uint64_t value)
{
  switch (reg)
    {
#define ARMHYP_MSR(name)                                        \
    case SysReg::name:                                          \
      asm volatile("msr " #name ", %0" :: "r"(value) : "memory"); \
      break;
      ARMHYP_SYSREGS(ARMHYP_MSR)
#undef ARMHYP_MSR

    default:
      std::cerr << "Error: System register " << sysRegName(reg) << " is not writable\n";
      break;
    }
}


uint64_t
Aarch64Cpu::readGpr(unsigned ix)
{
  if (not frame_ or ix > 30)
    return 0;
  return frame_[ix];
}


void
Aarch64Cpu::writeGpr(unsigned ix, uint64_t value)
{
  if (frame_ and ix <= 30)
    frame_[ix] = value;
}


VecReg
Aarch64Cpu::readVecReg(unsigned ix)
{
  alignas(16) uint64_t buf[2] = { 0, 0 };

  switch (ix)
    {
#define ARMHYP_STR_Q(n)                                                 \
    case n:                                                             \
      asm volatile("str q" #n ", [%0]" :: "r"(buf) : "memory");         \
      break;
      ARMHYP_VREGS(ARMHYP_STR_Q)
#undef ARMHYP_STR_Q
    default:
      break;
    }

  return VecReg{buf[0], buf[1]};
}


void
Aarch64Cpu::writeVecReg(unsigned ix, const VecReg& value)
{
  alignas(16) uint64_t buf[2] = { value.lo, value.hi };

  switch (ix)
    {
#define ARMHYP_LDR_Q(n)                                                 \
    case n:                                                             \
      asm volatile("ldr q" #n ", [%0]" :: "r"(buf) : "memory", "v" #n); \
      break;
      ARMHYP_VREGS(ARMHYP_LDR_Q)
#undef ARMHYP_LDR_Q
    default:
      break;
    }
}


void
Aarch64Cpu::instructionBarrier()
{
  asm volatile("isb" ::: "memory");
}


void
Aarch64Cpu::dataBarrier()
{
  asm volatile("dsb ish" ::: "memory");
}


template <typename FN>
void
Aarch64Cpu::withVmid(uint32_t vmid, FN fn)
{
  uint64_t saved = readSysReg(SysReg::VTTBR_EL2);
  VttbrFields vttbr(saved);
  bool swap = vttbr.bits_.VMID != (vmid & 0xff);
  if (swap)
    {
      vttbr.bits_.VMID = vmid & 0xff;
      writeSysReg(SysReg::VTTBR_EL2, vttbr.value_);
      instructionBarrier();
    }

  fn();

  if (swap)
    {
      writeSysReg(SysReg::VTTBR_EL2, saved);
      instructionBarrier();
    }
}


void
Aarch64Cpu::tlbInvalidateIpa(uint32_t vmid, uint64_t ipa)
{
  withVmid(vmid, [ipa]() {
    uint64_t operand = (ipa >> 12) & UINT64_C(0xf'ffff'ffff);
    asm volatile("dsb ishst" ::: "memory");
    asm volatile("tlbi ipas2e1is, %0" :: "r"(operand) : "memory");
    // Stage-1 entries may combine the removed stage-2 translation.
    asm volatile("dsb ish" ::: "memory");
    asm volatile("tlbi vmalle1is" ::: "memory");
    asm volatile("dsb ish" ::: "memory");
  });
}


void
Aarch64Cpu::tlbInvalidateVmid(uint32_t vmid)
{
  withVmid(vmid, []() {
    asm volatile("dsb ishst" ::: "memory");
    asm volatile("tlbi vmalls12e1is" ::: "memory");
    asm volatile("dsb ish" ::: "memory");
  });
}


void
Aarch64Cpu::tlbInvalidateAll()
{
  asm volatile("dsb ishst" ::: "memory");
  asm volatile("tlbi alle1is" ::: "memory");
  asm volatile("dsb ish" ::: "memory");
}
