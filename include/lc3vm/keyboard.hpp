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

#ifndef _LC3VM_KEYBOARD_HPP
#define _LC3VM_KEYBOARD_HPP

#include "lc3vm/bus.hpp"

namespace LC3VM {

class InputChannel;

/*
 * Keyboard side of the KBSR/KBDR protocol for programs that poll the device
 * registers instead of using GETC/IN.
 *
 * When the program reads KBSR with the ready bit clear and a byte is waiting
 * on the input channel, the byte is latched into KBDR and KBSR bit 15 is set
 * before the read completes. Reading KBDR clears the ready bit again.
 * Input is only consumed on a KBSR poll, so GETC/IN keep working alongside.
 */
class Keyboard : public BusObserver
{
public:
  enum { READY = 0x8000 };

  explicit Keyboard(InputChannel &input) : input(input) { }

  void before_read(Memory &mem, uint16_t address);
  void after_read(Memory &mem, uint16_t address, uint16_t value);

private:
  InputChannel &input;
};

}

#endif
