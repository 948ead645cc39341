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

#ifndef _LC3VM_TRAP_HPP
#define _LC3VM_TRAP_HPP

#include <stdint.h>

namespace LC3VM {

class Machine;
class InputChannel;
class OutputChannel;

enum TrapVector
{
  TRAP_GETC  = 0x20,
  TRAP_OUT   = 0x21,
  TRAP_PUTS  = 0x22,
  TRAP_IN    = 0x23,
  TRAP_PUTSP = 0x24,
  TRAP_HALT  = 0x25
};

/*
 * Operating system services, run natively instead of through the trap
 * vector table. GETC and IN read the input channel directly; the keyboard
 * device registers are not involved.
 */
class TrapDispatcher
{
public:
  TrapDispatcher(Machine &machine, InputChannel &input, OutputChannel &output);

  static bool implemented(uint8_t vector);

  // Runs the service routine for `vector'. Returns true for HALT.
  // Throws IllegalTrap for vectors without a routine.
  bool dispatch(uint8_t vector);

private:
  void read_char(bool echo);
  void put_char();
  void put_string();
  void put_packed_string();

  Machine &machine;
  InputChannel &input;
  OutputChannel &output;
};

}

#endif
