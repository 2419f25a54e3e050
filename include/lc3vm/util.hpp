/*\
 *  LC-3 VM
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
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

#ifndef _LC3VM_UTIL_HPP
#define _LC3VM_UTIL_HPP

#include <stdint.h>

namespace LC3VM {

// Mask of the low `bits' bits.
inline uint16_t mask(int bits)
{
  return (uint16_t)((1u << bits) - 1);
}

// Zero extended field [hi..lo] of a word.
inline uint16_t zext(uint16_t word, int hi, int lo)
{
  return (word >> lo) & mask(hi - lo + 1);
}

// Sign extend the low `bits' bits of value to a full word.
inline uint16_t sext(uint16_t value, int bits)
{
  value &= mask(bits);
  if (value & (1u << (bits - 1))) {
    value |= (uint16_t)(0xFFFF << bits);
  }
  return value;
}

// Field [hi..lo] of a word, sign extended.
inline uint16_t sext(uint16_t word, int hi, int lo)
{
  return sext(zext(word, hi, lo), hi - lo + 1);
}

inline int16_t as_signed(uint16_t word)
{
  return (word & 0x8000) ? (int16_t)(word - 0x10000) : (int16_t)word;
}

}

#endif
