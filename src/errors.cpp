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
#include "lc3vm/errors.hpp"

namespace LC3VM {

static std::string format_illegal_opcode(uint16_t opcode, uint16_t word)
{
  char buf[64];
  snprintf(buf, sizeof(buf), "unimplemented opcode 0x%x (instruction x%.4x)",
           opcode & 0xF, word & 0xFFFF);
  return buf;
}

static std::string format_illegal_trap(uint8_t vector)
{
  char buf[48];
  snprintf(buf, sizeof(buf), "unimplemented trap vector x%.2x", vector);
  return buf;
}

IllegalOpcode::IllegalOpcode(uint16_t opcode, uint16_t word)
  : Error(format_illegal_opcode(opcode, word)), op(opcode), IR(word)
{
}

IllegalTrap::IllegalTrap(uint8_t vector)
  : Error(format_illegal_trap(vector)), vect(vector)
{
}

}
