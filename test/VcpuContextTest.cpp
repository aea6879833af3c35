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
#include <string>
#include <gtest/gtest.h>
#include "SimCpu.hpp"
#include "VcpuContext.hpp"

using namespace ArmHyp;


TEST(VcpuContext, ResetDefaults)
{
  VcpuContext ctx(4);
  EXPECT_EQ(ctx.id(), 4u);
  EXPECT_EQ(ctx.pstate(), 0x3c5u);
  EXPECT_EQ(ctx.pc(), 0u);
  EXPECT_EQ(ctx.sp(), 0u);

  uint64_t sctlr = 0;
  ASSERT_TRUE(ctx.sysReg(SysReg::SCTLR_EL1, sctlr));
  EXPECT_EQ(sctlr, 0x30d00800u);

  for (unsigned i = 0; i < ctx.intRegs().size(); ++i)
    EXPECT_EQ(ctx.intRegs().read(i), 0u);

  uint64_t value = 0;
  EXPECT_FALSE(ctx.sysReg(SysReg::HCR_EL2, value));
  EXPECT_FALSE(ctx.setSysReg(SysReg::HCR_EL2, 1));
}


TEST(VcpuContext, ResetClearsGuestStateButKeepsHypRecord)
{
  VcpuContext ctx(1);
  ctx.intRegs().write(3, 33);
  ctx.setPc(0x8000);
  ctx.setSp(0x9000);
  ctx.fpRegs().write(1, VecReg{1, 2});
  ctx.hyp().vttbr = 0x0100'0000'4000'0000;

  ctx.reset();
  EXPECT_EQ(ctx.intRegs().read(3), 0u);
  EXPECT_EQ(ctx.pc(), 0u);
  EXPECT_EQ(ctx.sp(), 0u);
  EXPECT_EQ(ctx.fpRegs().read(1), VecReg{});
  EXPECT_EQ(ctx.hyp().vttbr, 0x0100'0000'4000'0000u);
}


TEST(VcpuContext, SaveRestoreNeedsMaskedInterrupts)
{
  SimCpu cpu;
  SysRegAccess regs(cpu);
  VcpuContext ctx(0);

  EXPECT_EQ(ctx.restoreGuest(regs), HvError::InterruptsEnabled);
  EXPECT_EQ(ctx.saveGuest(regs), HvError::InterruptsEnabled);
  EXPECT_EQ(cpu.writeCount(), 0u);
}


TEST(VcpuContext, RoundTripIsBitIdentical)
{
  SimCpu cpu;
  SysRegAccess regs(cpu);
  IrqGuard guard(regs);

  VcpuContext ctx(2);
  ctx.reset();
  for (unsigned i = 0; i < ctx.intRegs().size(); ++i)
    ctx.intRegs().write(i, 0x1000 + i);
  ctx.setPc(0x4008'0000);
  ctx.setPstate(0x3c4);
  ctx.setSp(0x4010'0000);
  ASSERT_TRUE(ctx.setSysReg(SysReg::TTBR0_EL1, 0x4100'0000));
  ASSERT_TRUE(ctx.setSysReg(SysReg::VBAR_EL1, 0x4000'0800));
  ASSERT_TRUE(ctx.setSysReg(SysReg::TPIDR_EL0, 0xdead));
  ctx.hyp().hcr = 0xe01;
  ctx.hyp().vttbr = 0x0200'0000'4000'3000;
  ctx.hyp().cptr = 0x400;
  ctx.hyp().vmpidr = 0x8000'0002;
  ctx.hyp().vpidr = 0x410f'd034;

  const VcpuContext before = ctx;

  ASSERT_EQ(ctx.restoreGuest(regs), HvError::None);
  EXPECT_EQ(cpu.readSysReg(SysReg::VTTBR_EL2), ctx.hyp().vttbr);
  EXPECT_EQ(cpu.readSysReg(SysReg::ELR_EL2), 0x4008'0000u);
  EXPECT_EQ(cpu.readSysReg(SysReg::SP_EL1), 0x4010'0000u);
  EXPECT_EQ(cpu.readGpr(30), 0x1000u + 30);

  ASSERT_EQ(ctx.saveGuest(regs), HvError::None);
  EXPECT_EQ(ctx, before);

  VcpuContext other(2);
  ASSERT_EQ(other.saveGuest(regs), HvError::None);
  EXPECT_EQ(other, before);
}


TEST(VcpuContext, SaveCapturesGuestChanges)
{
  SimCpu cpu;
  SysRegAccess regs(cpu);
  IrqGuard guard(regs);

  VcpuContext ctx(0);
  ASSERT_EQ(ctx.restoreGuest(regs), HvError::None);

  cpu.pokeGpr(0, 42);
  cpu.pokeSysReg(SysReg::ELR_EL2, 0x1234);
  cpu.pokeSysReg(SysReg::ESR_EL1, 0x9600'0045);

  ASSERT_EQ(ctx.saveGuest(regs), HvError::None);
  EXPECT_EQ(ctx.intRegs().read(0), 42u);
  EXPECT_EQ(ctx.pc(), 0x1234u);
  uint64_t esr = 0;
  ASSERT_TRUE(ctx.sysReg(SysReg::ESR_EL1, esr));
  EXPECT_EQ(esr, 0x9600'0045u);
}


TEST(HostContext, SaveRestore)
{
  SimCpu cpu;
  SysRegAccess regs(cpu);
  IrqGuard guard(regs);

  cpu.pokeSysReg(SysReg::HCR_EL2, 0xe01);
  cpu.pokeSysReg(SysReg::TPIDR_EL2, 0xffff'0000'1234'0000);
  cpu.pokeSysReg(SysReg::MDCR_EL2, 0x6);

  HostContext host;
  ASSERT_EQ(saveHost(regs, host), HvError::None);
  EXPECT_EQ(host.hcr, 0xe01u);
  EXPECT_EQ(host.tpidr, 0xffff'0000'1234'0000u);

  cpu.pokeSysReg(SysReg::HCR_EL2, 0);
  cpu.pokeSysReg(SysReg::TPIDR_EL2, 0);
  cpu.pokeSysReg(SysReg::VTTBR_EL2, 0x0300'0000'0000'1000);

  ASSERT_EQ(restoreHost(regs, host), HvError::None);
  EXPECT_EQ(cpu.readSysReg(SysReg::HCR_EL2), 0xe01u);
  EXPECT_EQ(cpu.readSysReg(SysReg::TPIDR_EL2), 0xffff'0000'1234'0000u);
  EXPECT_EQ(cpu.readSysReg(SysReg::VTTBR_EL2), 0u);
  EXPECT_EQ(cpu.readSysReg(SysReg::MDCR_EL2), 0x6u);
}


TEST(VcpuContext, RegisterNames)
{
  VcpuContext ctx;
  unsigned ix = 0;
  ASSERT_TRUE(ctx.intRegs().findReg("lr", ix));
  EXPECT_EQ(ix, 30u);
  ASSERT_TRUE(ctx.intRegs().findReg("x29", ix));
  EXPECT_EQ(ix, 29u);
  ASSERT_TRUE(ctx.intRegs().findReg("ip0", ix));
  EXPECT_EQ(ix, 16u);
  EXPECT_FALSE(ctx.intRegs().findReg("x31", ix));
  EXPECT_FALSE(ctx.intRegs().findReg("sp", ix));

  EXPECT_EQ(IntRegs::regName(29), "x29");
  EXPECT_EQ(IntRegs::regName(29, true), "fp");
  EXPECT_EQ(IntRegs::regName(31), "x?");

  ASSERT_TRUE(ctx.fpRegs().findReg("q7", ix));
  EXPECT_EQ(ix, 7u);
  ASSERT_TRUE(ctx.fpRegs().findReg("v31", ix));
  EXPECT_EQ(ix, 31u);
  EXPECT_FALSE(ctx.fpRegs().findReg("v32", ix));
  EXPECT_EQ(FpRegs::regName(3, true), "q3");
}


TEST(VcpuContext, Print)
{
  VcpuContext ctx;
  ctx.intRegs().write(30, 0x8'0010);
  ctx.setPc(0x8'0000);

  std::ostringstream plain, abi;
  ctx.print(plain);
  ctx.print(abi, true);

  EXPECT_NE(plain.str().find("x30              0x0000000000080010\n"), std::string::npos);
  EXPECT_NE(abi.str().find("lr               0x0000000000080010\n"), std::string::npos);
  EXPECT_NE(plain.str().find("pc               0x0000000000080000\n"), std::string::npos);
  EXPECT_NE(plain.str().find("pstate           0x00000000000003c5\n"), std::string::npos);
  EXPECT_NE(plain.str().find("SCTLR_EL1        0x0000000030d00800\n"), std::string::npos);
}
