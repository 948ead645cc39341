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
#include "lc3vm/disassembler.hpp"

using namespace LC3VM;

TEST(DisassemblerTest, Operate)
{
  EXPECT_EQ("ADD R2, R0, R1", disassemble(0x1401, 0x3000));
  EXPECT_EQ("ADD R3, R2, #-2", disassemble(0x16BE, 0x3000));
  EXPECT_EQ("AND R0, R0, #0", disassemble(0x5020, 0x3000));
  EXPECT_EQ("NOT R1, R0", disassemble(0x923F, 0x3000));
}

TEST(DisassemblerTest, BranchTargetsAreAbsolute)
{
  EXPECT_EQ("BRnzp x3003", disassemble(0x0E02, 0x3000));
  EXPECT_EQ("BRz x3003", disassemble(0x0402, 0x3000));
  EXPECT_EQ("BRnp x3003", disassemble(0x0BFD, 0x3005));
  EXPECT_EQ("BRnzp x0000", disassemble(0x0FFF, 0x0000));
  EXPECT_EQ("NOP", disassemble(0x0000, 0x3000));
}

TEST(DisassemblerTest, Control)
{
  EXPECT_EQ("RET", disassemble(0xC1C0, 0x3000));
  EXPECT_EQ("JMP R2", disassemble(0xC080, 0x3000));
  EXPECT_EQ("JSR x3006", disassemble(0x4805, 0x3000));
  EXPECT_EQ("JSRR R3", disassemble(0x40C0, 0x3000));
}

TEST(DisassemblerTest, Memory)
{
  EXPECT_EQ("LEA R0, x3003", disassemble(0xE002, 0x3000));
  EXPECT_EQ("LD R4, x3006", disassemble(0x2805, 0x3000));
  EXPECT_EQ("LDI R1, x3003", disassemble(0xA202, 0x3000));
  EXPECT_EQ("STI R1, x3003", disassemble(0xB202, 0x3000));
  EXPECT_EQ("LDR R2, R6, #-32", disassemble(0x65A0, 0x3000));
  EXPECT_EQ("STR R1, R2, #31", disassemble(0x729F, 0x3000));
}

TEST(DisassemblerTest, Traps)
{
  EXPECT_EQ("GETC", disassemble(0xF020, 0x3000));
  EXPECT_EQ("PUTS", disassemble(0xF022, 0x3000));
  EXPECT_EQ("HALT", disassemble(0xF025, 0x3000));
  EXPECT_EQ("TRAP x26", disassemble(0xF026, 0x3000));
  EXPECT_TRUE(trap_name(0x1F) == NULL);
}

TEST(DisassemblerTest, WordsThatDoNotDecode)
{
  EXPECT_EQ(".FILL xd123", disassemble(0xD123, 0x3000));
  EXPECT_EQ("RTI", disassemble(0x8000, 0x3000));
  EXPECT_EQ(".FILL x8001", disassemble(0x8001, 0x3000));
}
