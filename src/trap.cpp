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

#include "lc3vm/trap.hpp"
#include "lc3vm/machine.hpp"
#include "lc3vm/channel.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

static const char *IN_PROMPT = "Input: ";

TrapDispatcher::TrapDispatcher(Machine &machine, InputChannel &input,
                               OutputChannel &output)
  : machine(machine), input(input), output(output)
{
}

bool TrapDispatcher::implemented(uint8_t vector)
{
  return vector >= TRAP_GETC && vector <= TRAP_HALT;
}

bool TrapDispatcher::dispatch(uint8_t vector)
{
  switch (vector) {
  case TRAP_GETC:
    read_char(false);
    break;
  case TRAP_OUT:
    put_char();
    break;
  case TRAP_PUTS:
    put_string();
    break;
  case TRAP_IN:
    output.write(IN_PROMPT);
    output.flush();
    read_char(true);
    break;
  case TRAP_PUTSP:
    put_packed_string();
    break;
  case TRAP_HALT:
    return true;
  default:
    throw IllegalTrap(vector);
  }
  return false;
}

// End of input leaves 0 in R0.
void TrapDispatcher::read_char(bool echo)
{
  int c = input.get();
  if (c == END_OF_INPUT) {
    machine.regs.set_reg(0, 0);
    return;
  }
  machine.regs.set_reg(0, c & 0xFF);
  if (echo) {
    output.put(c);
    output.flush();
  }
}

void TrapDispatcher::put_char()
{
  output.put(machine.regs.reg(0) & 0xFF);
  output.flush();
}

void TrapDispatcher::put_string()
{
  uint16_t address = machine.regs.reg(0);
  for (long n = 0; n < Memory::SIZE; n++, address++) {
    uint16_t word = machine.mem[address];
    if (word == 0) {
      break;
    }
    output.put(word & 0xFF);
  }
  output.flush();
}

// Low byte first. A zero byte in either half ends the string.
void TrapDispatcher::put_packed_string()
{
  uint16_t address = machine.regs.reg(0);
  for (long n = 0; n < Memory::SIZE; n++, address++) {
    uint16_t word = machine.mem[address];
    uint8_t lo = word & 0xFF;
    uint8_t hi = word >> 8;
    if (lo == 0) {
      break;
    }
    output.put(lo);
    if (hi == 0) {
      break;
    }
    output.put(hi);
  }
  output.flush();
}

}
