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

#include "lc3vm/trace.hpp"
#include "lc3vm/disassembler.hpp"

namespace LC3VM {

void Tracer::fetched(uint16_t address, uint16_t IR)
{
  fprintf(traceout, "%.4x: %.4x  %s\n", address, IR,
          disassemble(IR, address).c_str());
}

void Tracer::after_read(Memory &mem, uint16_t address, uint16_t value)
{
  fprintf(traceout, "MEM[%04x] RD %04x\n", address, value);
}

void Tracer::wrote(Memory &mem, uint16_t address, uint16_t value)
{
  fprintf(traceout, "MEM[%04x] WR %04x\n", address, value);
}

}
