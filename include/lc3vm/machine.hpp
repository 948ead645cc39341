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

#ifndef _LC3VM_MACHINE_HPP
#define _LC3VM_MACHINE_HPP

#include <string>
#include <stdint.h>
#include "lc3vm/memory.hpp"
#include "lc3vm/registers.hpp"

namespace LC3VM {

class InputChannel;
class OutputChannel;

// Complete execution state of one LC-3.
class Machine
{
public:
  Machine();
  void reset();

  Memory mem;
  RegisterFile regs;
  bool halted;
  unsigned long instructions;
};

enum RunStatus
{
  Halted,
  UnimplementedOpcode,
  UnimplementedTrap,
  Interrupted
};

struct RunResult
{
  RunResult(RunStatus status, uint16_t code, uint16_t pc)
    : status(status), code(code), pc(pc) { }

  std::string describe() const;

  RunStatus status;
  uint16_t code;        // opcode or trap vector
  uint16_t pc;          // address of the instruction that stopped the run
};

// Runs until HALT or until an instruction cannot be executed.
RunResult run(Machine &machine, InputChannel &in, OutputChannel &out);

}

#endif
