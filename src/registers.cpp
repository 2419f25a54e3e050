/*\
 *  This file is part of LC-3 VM.
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

#include <stdexcept>
#include "lc3vm/registers.hpp"

namespace LC3VM {

RegisterFile::RegisterFile()
{
  reset();
}

void RegisterFile::reset()
{
  for (int i = 0; i < COUNT; i++) {
    R[i] = 0;
  }
  PC = PC_START;
  cond = FL_ZRO;
}

uint16_t RegisterFile::get(int index) const
{
  if (index < 0 || index >= COUNT) {
    throw std::out_of_range("register index");
  }
  return R[index];
}

void RegisterFile::set(int index, uint16_t value)
{
  if (index < 0 || index >= COUNT) {
    throw std::out_of_range("register index");
  }
  R[index] = value;
}

void RegisterFile::update_flags(uint16_t value)
{
  if (value == 0) {
    cond = FL_ZRO;
  } else if (value & 0x8000) {
    cond = FL_NEG;
  } else {
    cond = FL_POS;
  }
}

const char *flag_name(Flags flag)
{
  switch (flag) {
  case FL_NEG: return "N";
  case FL_ZRO: return "Z";
  case FL_POS: return "P";
  }
  return "?";
}

}
