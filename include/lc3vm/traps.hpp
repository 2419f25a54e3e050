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

#ifndef _LC3VM_TRAPS_HPP
#define _LC3VM_TRAPS_HPP

#include <stdint.h>
#include "lc3vm/io.hpp"
#include "lc3vm/memory.hpp"
#include "lc3vm/registers.hpp"

namespace LC3VM {

enum TrapVector
{
  TRAP_GETC  = 0x20, // read a character into R0, no echo
  TRAP_OUT   = 0x21, // write the character in R0
  TRAP_PUTS  = 0x22, // write a string, one character per word
  TRAP_IN    = 0x23, // prompt, read a character and echo it
  TRAP_PUTSP = 0x24, // write a string, two characters per word
  TRAP_HALT  = 0x25
};

enum TrapResult
{
  TrapContinue,
  TrapHalt
};

// NULL for vectors without a service routine.
const char *trap_name(uint8_t vector);

/*
 * The OS service routines, implemented natively instead of by trap
 * handlers in LC-3 code. Strings are read through Memory::read and
 * wrap around at the end of the address space.
 */
class TrapDispatcher
{
public:
  TrapDispatcher(Memory &mem, RegisterFile &regs, InputSource &input, OutputSink &output);

  // Errors are reported at PC-1, the TRAP instruction being serviced.
  TrapResult dispatch(uint8_t vector);

private:
  uint16_t read_char();
  void getc();
  void out();
  void puts();
  void in();
  void putsp();

  Memory &mem;
  RegisterFile &regs;
  InputSource &input;
  OutputSink &output;
};

}

#endif
