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

#ifndef _LC3VM_REGISTERS_HPP
#define _LC3VM_REGISTERS_HPP

#include <stdint.h>

namespace LC3VM {

// Condition codes, laid out as the NZP bits of the PSR.
enum Flags
{
  FL_POS = 1 << 0,
  FL_ZRO = 1 << 1,
  FL_NEG = 1 << 2
};

class RegisterFile
{
public:
  enum { COUNT = 8, PC_START = 0x3000 };

  RegisterFile();
  void reset();

  uint16_t get(int index) const;
  void set(int index, uint16_t value);

  uint16_t pc() const { return PC; }
  void set_pc(uint16_t value) { PC = value; }

  Flags flags() const { return cond; }
  void update_flags(uint16_t value);

private:
  uint16_t R[COUNT];
  uint16_t PC;
  Flags cond;
};

// Name of a single flag ("N", "Z" or "P").
const char *flag_name(Flags flag);

}

#endif
