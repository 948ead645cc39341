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

#ifndef _LC3VM_TRACE_HPP
#define _LC3VM_TRACE_HPP

#include <stdio.h>
#include "lc3vm/bus.hpp"

namespace LC3VM {

// Execution trace: one line per fetched instruction with its disassembly,
// one line per data access.
//
//   3000: e002  LEA R0, x3003
//   MEM[3005] RD 0041
class Tracer : public BusObserver
{
public:
  explicit Tracer(FILE *traceout) : traceout(traceout) { }

  void fetched(uint16_t address, uint16_t IR);
  void after_read(Memory &mem, uint16_t address, uint16_t value);
  void wrote(Memory &mem, uint16_t address, uint16_t value);

private:
  FILE *traceout;
};

}

#endif
