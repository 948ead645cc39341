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

#ifndef _LC3VM_CPU_HPP
#define _LC3VM_CPU_HPP

#include <vector>
#include <stddef.h>
#include <signal.h>
#include <stdint.h>
#include "lc3vm/machine.hpp"
#include "lc3vm/instruction.hpp"
#include "lc3vm/trap.hpp"
#include "lc3vm/bus.hpp"

namespace LC3VM {

class CPU
{
public:
  CPU(Machine &machine, InputChannel &in, OutputChannel &out);

  // Observers are not owned and must outlive the CPU.
  void attach(BusObserver *observer);

  // One fetch-decode-execute step. An instruction that cannot be executed
  // throws before it changes any state, leaving PC on it.
  void cycle();
  void execute(const Instruction &inst);

  // Cycles until HALT, an unimplemented opcode or trap, or until
  // *interrupted becomes non-zero.
  RunResult run(const volatile sig_atomic_t *interrupted = NULL);

private:
  uint16_t load(uint16_t address);
  void store(uint16_t address, uint16_t value);

  Machine &machine;
  TrapDispatcher traps;
  std::vector<BusObserver *> observers;
};

}

#endif
