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

#include <stdio.h>
#include "lc3vm/traps.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

static const char *IN_PROMPT = "Enter a character: ";

const char *trap_name(uint8_t vector)
{
  switch (vector) {
  case TRAP_GETC:  return "GETC";
  case TRAP_OUT:   return "OUT";
  case TRAP_PUTS:  return "PUTS";
  case TRAP_IN:    return "IN";
  case TRAP_PUTSP: return "PUTSP";
  case TRAP_HALT:  return "HALT";
  }
  return NULL;
}

TrapDispatcher::TrapDispatcher(Memory &mem, RegisterFile &regs,
			       InputSource &input, OutputSink &output) :
  mem(mem), regs(regs), input(input), output(output)
{
}

TrapResult TrapDispatcher::dispatch(uint8_t vector)
{
  switch (vector) {
  case TRAP_GETC:
    getc();
    break;
  case TRAP_OUT:
    out();
    break;
  case TRAP_PUTS:
    puts();
    break;
  case TRAP_IN:
    in();
    break;
  case TRAP_PUTSP:
    putsp();
    break;
  case TRAP_HALT:
    output.flush();
    return TrapHalt;
  default:
    {
      char buf[32];
      snprintf(buf, sizeof(buf), "no service routine for x%.2X", vector);
      throw Error(InvalidTrap, regs.pc() - 1, buf);
    }
  }
  return TrapContinue;
}

uint16_t TrapDispatcher::read_char()
{
  // whatever the program printed so far is its prompt
  output.flush();
  int c = input.read_one_byte();
  if (c < 0) {
    throw Error(InputExhausted, regs.pc() - 1, "end of input");
  }
  return (uint16_t)c;
}

void TrapDispatcher::getc()
{
  regs.set(0, read_char());
}

void TrapDispatcher::out()
{
  output.put(regs.get(0) & 0xFF);
}

void TrapDispatcher::puts()
{
  uint16_t addr = regs.get(0);
  // stops after one pass over memory if there is no terminator at all
  for (int n = 0; n < Memory::SIZE; n++, addr++) {
    uint16_t c = mem.read(addr);
    if (!c) {
      break;
    }
    output.put(c & 0xFF);
  }
}

void TrapDispatcher::in()
{
  output.write(IN_PROMPT);
  uint16_t c = read_char();
  output.put(c & 0xFF);
  regs.set(0, c);
}

void TrapDispatcher::putsp()
{
  uint16_t addr = regs.get(0);
  for (int n = 0; n < Memory::SIZE; n++, addr++) {
    uint16_t c = mem.read(addr);
    if (!c) {
      break;
    }
    output.put(c & 0xFF);
    if (c >> 8) {
      output.put(c >> 8);
    }
  }
}

}
