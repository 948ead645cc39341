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

#ifndef _LC3VM_ERRORS_HPP
#define _LC3VM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <stdint.h>

namespace LC3VM {

class Error : public std::runtime_error
{
public:
  explicit Error(const std::string &what) : std::runtime_error(what) { }
};

// Malformed or unreadable object image. Raised before any memory cell is
// written.
class LoadError : public Error
{
public:
  explicit LoadError(const std::string &what) : Error(what) { }
};

// Opcode with no instruction behind it (RTI and the reserved 1101).
class IllegalOpcode : public Error
{
public:
  IllegalOpcode(uint16_t opcode, uint16_t word);

  uint16_t opcode() const { return op; }
  uint16_t word() const { return IR; }

private:
  uint16_t op;
  uint16_t IR;
};

class IllegalTrap : public Error
{
public:
  explicit IllegalTrap(uint8_t vector);

  uint8_t vector() const { return vect; }

private:
  uint8_t vect;
};

class IoError : public Error
{
public:
  explicit IoError(const std::string &what) : Error(what) { }
};

}

#endif
