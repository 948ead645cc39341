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
#include "lc3vm/machine.hpp"
#include "lc3vm/cpu.hpp"

namespace LC3VM {

Machine::Machine()
  : halted(false), instructions(0)
{
}

void Machine::reset()
{
  mem.clear();
  regs.reset();
  halted = false;
  instructions = 0;
}

std::string RunResult::describe() const
{
  char buf[80];
  switch (status) {
  case Halted:
    snprintf(buf, sizeof(buf), "halted at x%.4x", pc);
    break;
  case UnimplementedOpcode:
    snprintf(buf, sizeof(buf), "unimplemented opcode 0x%x at x%.4x", code, pc);
    break;
  case UnimplementedTrap:
    snprintf(buf, sizeof(buf), "unimplemented trap x%.2x at x%.4x", code, pc);
    break;
  case Interrupted:
    snprintf(buf, sizeof(buf), "interrupted at x%.4x", pc);
    break;
  }
  return buf;
}

RunResult run(Machine &machine, InputChannel &in, OutputChannel &out)
{
  CPU cpu(machine, in, out);
  return cpu.run();
}

}
