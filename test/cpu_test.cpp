/*\
 *  LC-3 Simulator
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
 *  Modifications 2010  Edgar Lakis <edgar.lakis@gmail.com>
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
\*/

#include <gtest/gtest.h>
#include "lc3vm/cpu.hpp"
#include "lc3vm/errors.hpp"
#include "channels.hpp"

using namespace LC3VM;

class CPUTest : public ::testing::Test
{
protected:
  CPUTest() : cpu(m, in, out) {
    m.regs.PC = 0x3000;
  }

  // Places IR at PC and runs one cycle.
  void exec(uint16_t IR) {
    m.mem[m.regs.PC] = IR;
    cpu.cycle();
  }

  Machine m;
  ScriptedInput in;
  CapturedOutput out;
  CPU cpu;
};

TEST_F(CPUTest, AddRegister)
{
  m.regs.R[0] = 5;
  m.regs.R[1] = 7;
  exec(0x1401);                 // ADD R2, R0, R1
  EXPECT_EQ(12, m.regs.R[2]);
  EXPECT_EQ(CC_P, m.regs.cc());
  EXPECT_EQ(0x3001, m.regs.PC);
  EXPECT_EQ(1UL, m.instructions);
}

TEST_F(CPUTest, AddImmediateNegative)
{
  m.regs.R[2] = 1;
  exec(0x16BE);                 // ADD R3, R2, #-2
  EXPECT_EQ(0xFFFF, m.regs.R[3]);
  EXPECT_EQ(CC_N, m.regs.cc());
}

TEST_F(CPUTest, AddWrapsAround)
{
  m.regs.R[0] = 0x7FFF;
  m.regs.R[1] = 1;
  exec(0x1401);
  EXPECT_EQ(0x8000, m.regs.R[2]);
  EXPECT_EQ(CC_N, m.regs.cc());

  m.regs.R[0] = 0xFFFF;
  exec(0x1401);
  EXPECT_EQ(0, m.regs.R[2]);
  EXPECT_EQ(CC_Z, m.regs.cc());
}

TEST_F(CPUTest, And)
{
  m.regs.R[0] = 0xD975;
  m.regs.R[1] = 0x4A29;
  exec(0x5401);                 // AND R2, R0, R1
  EXPECT_EQ(0x4821, m.regs.R[2]);
  EXPECT_EQ(CC_P, m.regs.cc());

  exec(0x5435);                 // AND R2, R0, #-11
  EXPECT_EQ(0xD975, m.regs.R[2]);
  EXPECT_EQ(CC_N, m.regs.cc());

  exec(0x5020);                 // AND R0, R0, #0
  EXPECT_EQ(0, m.regs.R[0]);
  EXPECT_EQ(CC_Z, m.regs.cc());
}

TEST_F(CPUTest, Not)
{
  m.regs.R[0] = 0x00FF;
  exec(0x923F);                 // NOT R1, R0
  EXPECT_EQ(0xFF00, m.regs.R[1]);
  EXPECT_EQ(CC_N, m.regs.cc());
}

TEST_F(CPUTest, BranchTaken)
{
  exec(0x0402);                 // BRz #2, Z is set after reset
  EXPECT_EQ(0x3003, m.regs.PC);
}

TEST_F(CPUTest, BranchNotTaken)
{
  exec(0x0802);                 // BRn #2
  EXPECT_EQ(0x3001, m.regs.PC);
}

TEST_F(CPUTest, BranchWithoutConditionNeverTaken)
{
  for (uint16_t cc = CC_P; cc <= CC_N; cc <<= 1) {
    m.regs.PC = 0x3000;
    m.regs.PSR = cc;
    exec(0x0002);
    EXPECT_EQ(0x3001, m.regs.PC);
  }
}

TEST_F(CPUTest, BranchOnAnyConditionAlwaysTaken)
{
  for (uint16_t cc = CC_P; cc <= CC_N; cc <<= 1) {
    m.regs.PC = 0x3000;
    m.regs.PSR = cc;
    exec(0x0E02);               // BRnzp #2
    EXPECT_EQ(0x3003, m.regs.PC);
  }
}

TEST_F(CPUTest, BranchBackwards)
{
  exec(0x0FFF);                 // BRnzp #-1
  EXPECT_EQ(0x3000, m.regs.PC);
}

TEST_F(CPUTest, BranchIgnoresUpperPSRBits)
{
  m.regs.PSR = 0x8000 | CC_Z;
  exec(0x0402);
  EXPECT_EQ(0x3003, m.regs.PC);
  EXPECT_EQ(0x8002, m.regs.PSR);
}

TEST_F(CPUTest, JumpAndReturn)
{
  m.regs.R[2] = 0x4000;
  exec(0xC080);                 // JMP R2
  EXPECT_EQ(0x4000, m.regs.PC);

  m.regs.R[7] = 0x3050;
  exec(0xC1C0);                 // RET
  EXPECT_EQ(0x3050, m.regs.PC);
}

TEST_F(CPUTest, JsrSavesReturnAddress)
{
  exec(0x4805);                 // JSR #5
  EXPECT_EQ(0x3001, m.regs.R[7]);
  EXPECT_EQ(0x3006, m.regs.PC);

  m.regs.PC = 0x3000;
  exec(0x4FFE);                 // JSR #-2
  EXPECT_EQ(0x2FFF, m.regs.PC);
}

TEST_F(CPUTest, RetReturnsPastJsr)
{
  exec(0x4805);                 // JSR #5
  exec(0xC1C0);                 // RET at x3006
  EXPECT_EQ(0x3001, m.regs.PC);
}

TEST_F(CPUTest, JsrLeavesFlags)
{
  m.regs.PSR = CC_N;
  exec(0x4805);
  EXPECT_EQ(CC_N, m.regs.cc());
}

TEST_F(CPUTest, Jsrr)
{
  m.regs.R[3] = 0x5000;
  exec(0x40C0);                 // JSRR R3
  EXPECT_EQ(0x5000, m.regs.PC);
  EXPECT_EQ(0x3001, m.regs.R[7]);
}

TEST_F(CPUTest, JsrrThroughR7UsesOldValue)
{
  m.regs.R[7] = 0x4000;
  exec(0x41C0);                 // JSRR R7
  EXPECT_EQ(0x4000, m.regs.PC);
  EXPECT_EQ(0x3001, m.regs.R[7]);
}

TEST_F(CPUTest, Load)
{
  m.mem[0x3006] = 0x8001;
  exec(0x2805);                 // LD R4, #5
  EXPECT_EQ(0x8001, m.regs.R[4]);
  EXPECT_EQ(CC_N, m.regs.cc());
}

TEST_F(CPUTest, LoadIndirect)
{
  m.mem[0x3003] = 0x4000;
  m.mem[0x4000] = 0;
  m.regs.PSR = CC_P;
  exec(0xA202);                 // LDI R1, #2
  EXPECT_EQ(0, m.regs.R[1]);
  EXPECT_EQ(CC_Z, m.regs.cc());
}

TEST_F(CPUTest, LoadBaseOffset)
{
  m.regs.R[6] = 0x3025;
  m.mem[0x3005] = 0x1234;
  exec(0x65A0);                 // LDR R2, R6, #-32
  EXPECT_EQ(0x1234, m.regs.R[2]);
  EXPECT_EQ(CC_P, m.regs.cc());
}

TEST_F(CPUTest, LoadEffectiveAddress)
{
  m.regs.PC = 0x3045;
  exec(0xE655);                 // LEA R3, #85
  EXPECT_EQ(0x309B, m.regs.R[3]);
  EXPECT_EQ(CC_P, m.regs.cc());
}

TEST_F(CPUTest, StoresLeaveFlags)
{
  m.regs.R[1] = 0xBEEF;
  exec(0x3203);                 // ST R1, #3
  EXPECT_EQ(0xBEEF, m.mem[0x3004]);
  EXPECT_EQ(CC_Z, m.regs.cc());

  m.regs.PC = 0x3000;
  m.mem[0x3003] = 0x4000;
  exec(0xB202);                 // STI R1, #2
  EXPECT_EQ(0xBEEF, m.mem[0x4000]);
  EXPECT_EQ(CC_Z, m.regs.cc());

  m.regs.R[1] = 7;
  m.regs.R[2] = 0x4001;
  exec(0x72BF);                 // STR R1, R2, #-1
  EXPECT_EQ(7, m.mem[0x4000]);
  EXPECT_EQ(CC_Z, m.regs.cc());
}

TEST_F(CPUTest, HaltTrap)
{
  exec(0xF025);
  EXPECT_TRUE(m.halted);
  EXPECT_EQ(0x3001, m.regs.R[7]);
  EXPECT_EQ(0x3001, m.regs.PC);
}

TEST_F(CPUTest, UnimplementedTrapChangesNothing)
{
  m.regs.R[7] = 0x1234;
  EXPECT_THROW(exec(0xF026), IllegalTrap);
  EXPECT_EQ(0x3000, m.regs.PC);
  EXPECT_EQ(0x1234, m.regs.R[7]);
  EXPECT_EQ(0UL, m.instructions);
}

TEST_F(CPUTest, UnimplementedOpcodesLeavePC)
{
  EXPECT_THROW(exec(0x8000), IllegalOpcode);
  EXPECT_EQ(0x3000, m.regs.PC);
  EXPECT_THROW(exec(0xD000), IllegalOpcode);
  EXPECT_EQ(0x3000, m.regs.PC);
  EXPECT_EQ(0UL, m.instructions);
}

TEST_F(CPUTest, PCWrapsAtTopOfMemory)
{
  m.regs.PC = 0xFFFF;
  exec(0x0000);
  EXPECT_EQ(0x0000, m.regs.PC);
}

TEST_F(CPUTest, AddAndEveryEncoding)
{
  static const uint16_t values[] = { 0, 1, 0x7FFF, 0x8000, 0xFFFF };
  static const uint16_t opcodes[] = { 0x1000, 0x5000 };

  for (int o = 0; o < 2; o++) {
    for (int k = 0; k < 5; k++) {
      for (uint16_t x = 0; x < 0x1000; x++) {
        uint16_t IR = opcodes[o] | x;
        int dr = (x >> 9) & 7;
        int sr1 = (x >> 6) & 7;
        for (int i = 0; i < 8; i++) {
          m.regs.R[i] = values[(i + k) % 5];
        }
        uint16_t a = m.regs.R[sr1];
        uint16_t b;
        if (x & 0x20) {
          int imm = x & 0x1F;
          b = (uint16_t)(imm >= 0x10 ? imm - 0x20 : imm);
        } else {
          b = m.regs.R[x & 7];
        }
        uint16_t expected = opcodes[o] == 0x1000 ? (uint16_t)(a + b) : (uint16_t)(a & b);
        uint16_t cc = expected == 0 ? CC_Z : (expected & 0x8000) ? CC_N : CC_P;

        m.regs.PC = 0x3000;
        exec(IR);
        ASSERT_EQ(expected, m.regs.R[dr]) << "IR " << std::hex << IR;
        ASSERT_EQ(cc, m.regs.cc()) << "IR " << std::hex << IR;
      }
    }
  }
}
