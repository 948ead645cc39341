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
#include "lc3vm/bits.hpp"

using namespace LC3VM;

TEST(BitsTest, ZextExtractsField)
{
  EXPECT_EQ(0xA, zext(0xA5F3, 15, 12));
  EXPECT_EQ(0x2, zext(0xA5F3, 11, 9));
  EXPECT_EQ(0x3, zext(0xA5F3, 2, 0));
  EXPECT_EQ(0xF3, zext(0xA5F3, 7, 0));
}

TEST(BitsTest, SextKeepsPositiveValues)
{
  EXPECT_EQ(15, sext(0x0F, 5));
  EXPECT_EQ(31, sext(0x1F, 6));
  EXPECT_EQ(255, sext(0xFF, 9));
  EXPECT_EQ(1023, sext(0x3FF, 11));
  EXPECT_EQ(0, sext(0, 5));
}

TEST(BitsTest, SextExtendsNegativeValues)
{
  EXPECT_EQ(-16, sext(0x10, 5));
  EXPECT_EQ(-1, sext(0x1F, 5));
  EXPECT_EQ(-32, sext(0x20, 6));
  EXPECT_EQ(-256, sext(0x100, 9));
  EXPECT_EQ(-1024, sext(0x400, 11));
}

TEST(BitsTest, SextIgnoresBitsAboveTheField)
{
  EXPECT_EQ(-1, sext(0xFFFF, 5));
  EXPECT_EQ(1, sext(0xFFE1, 5));
}

TEST(BitsTest, NegativeValuesSurviveEveryFieldWidth)
{
  const int widths[] = { 5, 6, 9, 11 };
  for (int w = 0; w < 4; w++) {
    int bits = widths[w];
    uint16_t mask = (1 << bits) - 1;
    for (int v = -(1 << (bits - 1)); v < 0; v++) {
      ASSERT_EQ(v, sext((uint16_t)v & mask, bits)) << "width " << bits;
    }
  }
}

TEST(BitsTest, SextOfField)
{
  // PCoffset9 of BRnzp #-3
  EXPECT_EQ(-3, sext(0x0FFD, 8, 0));
  // offset6 of LDR R2, R6, #-32
  EXPECT_EQ(-32, sext(0x65A0, 5, 0));
}

TEST(BitsTest, Bit)
{
  EXPECT_TRUE(bit(0x0800, 11));
  EXPECT_FALSE(bit(0x0800, 10));
  EXPECT_TRUE(bit(0x8000, 15));
}
