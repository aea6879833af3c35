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

#include <gtest/gtest.h>
#include "LazyFpu.hpp"
#include "SimCpu.hpp"
#include "SysRegFields.hpp"

using namespace ArmHyp;


namespace
{
  constexpr uint64_t fpTrapEsr = uint64_t(ExceptionClass::FP_ACCESS) << 26;

  bool
  fpTrapped(SimCpu& cpu)
  {
    return CptrFields(cpu.readSysReg(SysReg::CPTR_EL2)).bits_.TFP;
  }
}


class LazyFpuTest : public ::testing::Test
{
protected:

  void SetUp() override
  {
    a_.fpRegs().write(0, VecReg{1, 2});
    a_.fpRegs().setFpcr(0x0300'0000);
    b_.fpRegs().write(0, VecReg{3, 4});
    cpu_.pokeVecReg(0, VecReg{9, 9});
  }

  SimCpu cpu_;
  SysRegAccess regs_{cpu_};
  LazyFpu fpu_{regs_};
  VcpuContext a_{1};
  VcpuContext b_{2};
};


TEST_F(LazyFpuTest, HostOwnsInitially)
{
  EXPECT_EQ(fpu_.owner().kind, FpuOwner::Kind::Host);
  EXPECT_FALSE(fpu_.owns(a_));
  EXPECT_EQ(fpu_.switchCount(), 0u);
}


TEST_F(LazyFpuTest, EntryTrapsWhenNotOwner)
{
  ASSERT_EQ(fpu_.trapOnEntry(a_), HvError::None);
  EXPECT_TRUE(fpTrapped(cpu_));
  EXPECT_TRUE(CptrFields(a_.hyp().cptr).bits_.TFP);
  EXPECT_EQ(cpu_.vecWriteCount(), 0u);
}


TEST_F(LazyFpuTest, TrapMovesRegisterFileOnce)
{
  IrqGuard guard(regs_);
  ASSERT_EQ(fpu_.trapOnEntry(a_), HvError::None);

  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, a_), HvError::None);
  EXPECT_EQ(fpu_.owner(), (FpuOwner{FpuOwner::Kind::Vcpu, 1}));
  EXPECT_TRUE(fpu_.owns(a_));
  EXPECT_EQ(cpu_.readVecReg(0), (VecReg{1, 2}));
  EXPECT_EQ(cpu_.readSysReg(SysReg::FPCR), 0x0300'0000u);
  EXPECT_EQ(fpu_.hostFp().read(0), (VecReg{9, 9}));
  EXPECT_FALSE(fpTrapped(cpu_));
  EXPECT_FALSE(CptrFields(a_.hyp().cptr).bits_.TFP);
  EXPECT_EQ(fpu_.switchCount(), 1u);

  // Same owner again: nothing moves.
  uint64_t writes = cpu_.vecWriteCount();
  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, a_), HvError::None);
  EXPECT_EQ(cpu_.vecWriteCount(), writes);
  EXPECT_EQ(fpu_.switchCount(), 1u);

  // Re-entry of the owner runs without trap.
  ASSERT_EQ(fpu_.trapOnEntry(a_), HvError::None);
  EXPECT_FALSE(fpTrapped(cpu_));
}


TEST_F(LazyFpuTest, OwnerChangeSavesPreviousOwner)
{
  IrqGuard guard(regs_);
  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, a_), HvError::None);

  // Guest a modifies its registers while owning them.
  cpu_.pokeVecReg(0, VecReg{5, 5});

  ASSERT_EQ(fpu_.trapOnEntry(b_), HvError::None);
  EXPECT_TRUE(fpTrapped(cpu_));
  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, b_), HvError::None);

  EXPECT_EQ(a_.fpRegs().read(0), (VecReg{5, 5}));
  EXPECT_EQ(cpu_.readVecReg(0), (VecReg{3, 4}));
  EXPECT_EQ(fpu_.owner(), (FpuOwner{FpuOwner::Kind::Vcpu, 2}));
  EXPECT_EQ(fpu_.switchCount(), 2u);

  ASSERT_EQ(fpu_.trapOnEntry(a_), HvError::None);
  EXPECT_TRUE(CptrFields(a_.hyp().cptr).bits_.TFP);
}


TEST_F(LazyFpuTest, HostReclaim)
{
  IrqGuard guard(regs_);
  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, a_), HvError::None);
  ASSERT_EQ(fpu_.claimForHost(), HvError::None);
  EXPECT_EQ(fpu_.owner().kind, FpuOwner::Kind::Host);
  EXPECT_EQ(cpu_.readVecReg(0), (VecReg{9, 9}));
  EXPECT_FALSE(fpu_.owns(a_));
}


TEST_F(LazyFpuTest, ReleaseWritesBackState)
{
  IrqGuard guard(regs_);
  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, a_), HvError::None);
  cpu_.pokeVecReg(0, VecReg{7, 7});

  EXPECT_EQ(fpu_.release(b_), HvError::None);
  EXPECT_TRUE(fpu_.owns(a_));

  ASSERT_EQ(fpu_.release(a_), HvError::None);
  EXPECT_EQ(fpu_.owner().kind, FpuOwner::Kind::None);
  EXPECT_EQ(a_.fpRegs().read(0), (VecReg{7, 7}));

  // Nothing to save when the next owner comes in.
  ASSERT_EQ(fpu_.handleTrap(fpTrapEsr, b_), HvError::None);
  EXPECT_EQ(cpu_.readVecReg(0), (VecReg{3, 4}));
}


TEST_F(LazyFpuTest, RejectsOtherTrapsAndUnmaskedInterrupts)
{
  EXPECT_EQ(fpu_.handleTrap(fpTrapEsr, a_), HvError::InterruptsEnabled);

  IrqGuard guard(regs_);
  uint64_t esr = uint64_t(ExceptionClass::DATA_ABORT_LOWER) << 26;
  EXPECT_EQ(fpu_.handleTrap(esr, a_), HvError::InvalidArgument);
  EXPECT_EQ(fpu_.owner().kind, FpuOwner::Kind::Host);
}
