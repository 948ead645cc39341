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

#ifndef _LC3VM_REGISTERS_HPP
#define _LC3VM_REGISTERS_HPP

#include <stdint.h>

namespace LC3VM {

// Condition code bits, in their PSR positions.
enum ConditionCode
{
  CC_P = 0x1,
  CC_Z = 0x2,
  CC_N = 0x4
};

class RegisterFile
{
public:
  RegisterFile();
  void reset();

  uint16_t reg(int index) const { return R[index & 7]; }
  int16_t sreg(int index) const { return (int16_t)R[index & 7]; }
  void set_reg(int index, uint16_t value) { R[index & 7] = value; }

  // Exactly one of N, Z, P is left set.
  void set_flags(int16_t result);
  uint16_t cc() const { return PSR & 0x7; }

  uint16_t PC;
  uint16_t PSR;
  uint16_t R[8];
};

}

#endif
