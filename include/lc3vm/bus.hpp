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

#ifndef _LC3VM_BUS_HPP
#define _LC3VM_BUS_HPP

#include <stdint.h>

namespace LC3VM {

class Memory;

// Hooks called by the CPU around instruction fetches and the data accesses
// of the load/store instructions.
struct BusObserver
{
  virtual ~BusObserver() = 0;
  virtual void fetched(uint16_t address, uint16_t IR) { }
  virtual void before_read(Memory &mem, uint16_t address) { }
  virtual void after_read(Memory &mem, uint16_t address, uint16_t value) { }
  virtual void wrote(Memory &mem, uint16_t address, uint16_t value) { }
};

}

#endif
