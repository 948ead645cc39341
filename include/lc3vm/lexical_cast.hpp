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

#ifndef _LC3VM_LEXICAL_CAST_HPP
#define _LC3VM_LEXICAL_CAST_HPP

#include <string>
#include <typeinfo>
#include <stdlib.h>
#include <stdint.h>

namespace LC3VM {

class bad_lexical_cast : public std::bad_cast {
public:
  const char *what() const throw () {
    return "Bad Lexical Cast";
  }
};

template <typename Target>
Target lexical_cast(const char *arg);

// Accepts LC-3 hex (x3000), C hex (0x3000) and decimal.
template<>
inline uint16_t lexical_cast<uint16_t>(const char *str)
{
  char *end = 0;
  int base = 0;
  if ((str[0]|0x20)=='x') {	// handle the lc3 hex (x1234)
    str++;
    base = 16;
  }
  long value = strtol(str, &end, base);
  if (!end || *end || value < 0 || value >= 0x10000 || end == str) {
    throw bad_lexical_cast();
  }

  return value & 0xFFFF;
}

template <typename Target>
inline Target lexical_cast(const std::string &arg)
{
  return lexical_cast<Target>(arg.c_str());
}

}

#endif
