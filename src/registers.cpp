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

#include "lc3vm/registers.hpp"

namespace LC3VM {

RegisterFile::RegisterFile()
{
  reset();
}

void RegisterFile::reset()
{
  for (int i = 0; i < 8; i++) {
    R[i] = 0;
  }
  PC = 0;
  PSR = CC_Z;
}

void RegisterFile::set_flags(int16_t result)
{
  uint16_t cc;
  if (result < 0) {
    cc = CC_N;
  } else if (result == 0) {
    cc = CC_Z;
  } else {
    cc = CC_P;
  }
  PSR = (PSR & ~0x7) | cc;
}

}
