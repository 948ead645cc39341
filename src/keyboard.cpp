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

#include "lc3vm/keyboard.hpp"
#include "lc3vm/memory.hpp"
#include "lc3vm/channel.hpp"

namespace LC3VM {

void Keyboard::before_read(Memory &mem, uint16_t address)
{
  if (address != KBSR || (mem[KBSR] & READY) || !input.ready()) {
    return;
  }
  int c = input.get();
  if (c == END_OF_INPUT) {
    return;
  }
  mem[KBDR] = c & 0xFF;
  mem[KBSR] |= READY;
}

void Keyboard::after_read(Memory &mem, uint16_t address, uint16_t value)
{
  if (address == KBDR) {
    mem[KBSR] &= ~READY;
  }
}

}
