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

#include "lc3vm/instruction.hpp"
#include "lc3vm/bits.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

bool is_implemented(uint16_t opcode)
{
  return opcode != OP_RTI && opcode != OP_RES;
}

Instruction decode(uint16_t IR)
{
  Instruction inst;
  inst.op = (Opcode)zext(IR, 15, 12);
  inst.IR = IR;
  inst.dr = zext(IR, 11, 9);
  inst.sr1 = zext(IR, 8, 6);
  inst.sr2 = zext(IR, 2, 0);
  inst.base = inst.sr1;
  inst.nzp = 0;
  inst.imm = false;
  inst.offset = 0;
  inst.vector = 0;

  switch (inst.op) {
  case OP_ADD:
  case OP_AND:
    inst.imm = bit(IR, 5);
    if (inst.imm) {
      inst.offset = sext(IR, 4, 0);
    }
    break;
  case OP_NOT:
  case OP_JMP:
    break;
  case OP_BR:
    inst.nzp = zext(IR, 11, 9);
    inst.offset = sext(IR, 8, 0);
    break;
  case OP_JSR:
    inst.imm = bit(IR, 11);
    if (inst.imm) {
      inst.offset = sext(IR, 10, 0);
    }
    break;
  case OP_LD:
  case OP_LDI:
  case OP_LEA:
  case OP_ST:
  case OP_STI:
    inst.offset = sext(IR, 8, 0);
    break;
  case OP_LDR:
  case OP_STR:
    inst.offset = sext(IR, 5, 0);
    break;
  case OP_TRAP:
    inst.vector = zext(IR, 7, 0);
    break;
  case OP_RTI:
  case OP_RES:
    throw IllegalOpcode(inst.op, IR);
  }

  return inst;
}

}
