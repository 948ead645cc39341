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

#ifndef _LC3VM_DISASSEMBLER_HPP
#define _LC3VM_DISASSEMBLER_HPP

#include <string>
#include <stdint.h>

namespace LC3VM {

// LC-3 assembly text for the word `IR' stored at `address'. PC relative
// operands are printed as absolute target addresses. Words that do not
// decode come out as `.FILL'.
std::string disassemble(uint16_t IR, uint16_t address);

const char *trap_name(uint8_t vector);

}

#endif
