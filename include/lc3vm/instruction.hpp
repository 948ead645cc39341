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

#ifndef _LC3VM_INSTRUCTION_HPP
#define _LC3VM_INSTRUCTION_HPP

#include <stdint.h>

namespace LC3VM {

enum Opcode
{
  OP_BR   = 0x0,
  OP_ADD  = 0x1,
  OP_LD   = 0x2,
  OP_ST   = 0x3,
  OP_JSR  = 0x4,
  OP_AND  = 0x5,
  OP_LDR  = 0x6,
  OP_STR  = 0x7,
  OP_RTI  = 0x8,
  OP_NOT  = 0x9,
  OP_LDI  = 0xA,
  OP_STI  = 0xB,
  OP_JMP  = 0xC,
  OP_RES  = 0xD,
  OP_LEA  = 0xE,
  OP_TRAP = 0xF
};

/*
 * A decoded instruction word. Which fields are meaningful depends on `op':
 *
 *   ADD, AND     dr, sr1, and either sr2 (imm == false) or offset (imm5)
 *   NOT          dr, sr1
 *   BR           nzp, offset (PCoffset9)
 *   JMP          base
 *   JSR          imm set: offset (PCoffset11); imm clear: base (JSRR)
 *   LD, LDI, LEA dr, offset (PCoffset9)
 *   ST, STI      dr (the source register), offset (PCoffset9)
 *   LDR          dr, base, offset (offset6)
 *   STR          dr (the source register), base, offset (offset6)
 *   TRAP         vector
 *
 * Offsets and immediates are already sign extended.
 */
struct Instruction
{
  Opcode op;
  uint16_t IR;
  uint8_t dr;
  uint8_t sr1;
  uint8_t sr2;
  uint8_t base;
  uint8_t nzp;
  bool imm;
  int16_t offset;
  uint8_t vector;
};

bool is_implemented(uint16_t opcode);

// Throws IllegalOpcode for RTI and the reserved opcode.
Instruction decode(uint16_t IR);

}

#endif
