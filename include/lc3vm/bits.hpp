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

#ifndef _LC3VM_BITS_HPP
#define _LC3VM_BITS_HPP

#include <stdint.h>

namespace LC3VM {

// Bits [hi:lo] of a word, shifted down to bit 0.
inline uint16_t zext(uint16_t word, int hi, int lo)
{
  return (word >> lo) & ((1 << (hi - lo + 1)) - 1);
}

// Extends the two's complement value held in the low `bits' bits of `value'
// to a full 16 bit signed word.
inline int16_t sext(uint16_t value, int bits)
{
  value &= (1 << bits) - 1;
  if (value & (1 << (bits - 1))) {
    value |= (0xFFFF << bits) & 0xFFFF;
  }
  return (int16_t)value;
}

inline int16_t sext(uint16_t word, int hi, int lo)
{
  return sext(zext(word, hi, lo), hi - lo + 1);
}

inline bool bit(uint16_t word, int n)
{
  return (word >> n) & 1;
}

}

#endif
