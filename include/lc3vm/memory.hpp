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

#ifndef _LC3VM_MEMORY_HPP
#define _LC3VM_MEMORY_HPP

#include <vector>
#include <stdint.h>

namespace LC3VM {

// Device registers. Memory gives them no behaviour of its own; they are
// plain cells that the program and the I/O side agree on.
enum DeviceAddress
{
  KBSR = 0xFE00,        // keyboard status, bit 15 set when KBDR holds a key
  KBDR = 0xFE02,        // keyboard data
  DSR  = 0xFE04,        // display status
  DDR  = 0xFE06,        // display data
  MCR  = 0xFFFE         // machine control
};

class Memory {
public:
  enum { SIZE = 0x10000 };

  Memory();

  uint16_t read(uint16_t address) const { return mem[address]; }
  void write(uint16_t address, uint16_t value) { mem[address] = value; }

  uint16_t &operator[](uint16_t address) { return mem[address]; }
  uint16_t operator[](uint16_t address) const { return mem[address]; }

  void clear();

private:
  std::vector<uint16_t> mem;
};

}

#endif
