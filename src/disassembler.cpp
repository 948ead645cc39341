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

#include <stdio.h>
#include "lc3vm/disassembler.hpp"
#include "lc3vm/instruction.hpp"
#include "lc3vm/bits.hpp"

namespace LC3VM {

static const char *MNEMONIC[16] = {
  "BR", "ADD", "LD", "ST", "JSR", "AND", "LDR", "STR",
  "RTI", "NOT", "LDI", "STI", "JMP", 0, "LEA", "TRAP"
};

const char *trap_name(uint8_t vector)
{
  switch (vector) {
  case 0x20: return "GETC";
  case 0x21: return "OUT";
  case 0x22: return "PUTS";
  case 0x23: return "IN";
  case 0x24: return "PUTSP";
  case 0x25: return "HALT";
  }
  return 0;
}

std::string disassemble(uint16_t IR, uint16_t address)
{
  char buf[64];
  uint16_t opcode = zext(IR, 15, 12);

  if (!is_implemented(opcode)) {
    if (opcode == OP_RTI && (IR & 0x0FFF) == 0) {
      return "RTI";
    }
    snprintf(buf, sizeof(buf), ".FILL x%.4x", IR);
    return buf;
  }

  Instruction inst = decode(IR);
  const char *name = MNEMONIC[inst.op];
  uint16_t target = address + 1 + inst.offset;

  switch (inst.op) {
  case OP_ADD:
  case OP_AND:
    if (inst.imm) {
      snprintf(buf, sizeof(buf), "%s R%d, R%d, #%d", name, inst.dr, inst.sr1, inst.offset);
    } else {
      snprintf(buf, sizeof(buf), "%s R%d, R%d, R%d", name, inst.dr, inst.sr1, inst.sr2);
    }
    break;
  case OP_NOT:
    snprintf(buf, sizeof(buf), "NOT R%d, R%d", inst.dr, inst.sr1);
    break;
  case OP_BR:
    if (inst.nzp == 0) {
      return "NOP";
    }
    snprintf(buf, sizeof(buf), "BR%s%s%s x%.4x",
             (inst.nzp & 0x4) ? "n" : "",
             (inst.nzp & 0x2) ? "z" : "",
             (inst.nzp & 0x1) ? "p" : "",
             target);
    break;
  case OP_JMP:
    if (inst.base == 7) {
      return "RET";
    }
    snprintf(buf, sizeof(buf), "JMP R%d", inst.base);
    break;
  case OP_JSR:
    if (inst.imm) {
      snprintf(buf, sizeof(buf), "JSR x%.4x", target);
    } else {
      snprintf(buf, sizeof(buf), "JSRR R%d", inst.base);
    }
    break;
  case OP_LD:
  case OP_LDI:
  case OP_LEA:
  case OP_ST:
  case OP_STI:
    snprintf(buf, sizeof(buf), "%s R%d, x%.4x", name, inst.dr, target);
    break;
  case OP_LDR:
  case OP_STR:
    snprintf(buf, sizeof(buf), "%s R%d, R%d, #%d", name, inst.dr, inst.base, inst.offset);
    break;
  case OP_TRAP:
    if (trap_name(inst.vector)) {
      return trap_name(inst.vector);
    }
    snprintf(buf, sizeof(buf), "TRAP x%.2x", inst.vector);
    break;
  case OP_RTI:
  case OP_RES:
    snprintf(buf, sizeof(buf), ".FILL x%.4x", IR);
    break;
  }

  return buf;
}

}
