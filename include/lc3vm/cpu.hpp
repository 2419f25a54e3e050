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

#ifndef _LC3VM_CPU_HPP
#define _LC3VM_CPU_HPP

#include <stdio.h>
#include "lc3vm/instruction.hpp"
#include "lc3vm/memory.hpp"
#include "lc3vm/registers.hpp"
#include "lc3vm/traps.hpp"

namespace LC3VM {

enum State
{
  Running,
  Halted,   // after the HALT trap
  Faulted   // after a fatal error, state frozen
};

const char *state_name(State state);

class CPU
{
public:
  CPU(Memory &mem, RegisterFile &regs, TrapDispatcher &traps);

  /*
   * One fetch-decode-execute cycle. PC is incremented right after the
   * fetch, so on an error it already points past the faulting word.
   * Errors put the CPU into the Faulted state and are rethrown.
   * Does nothing unless Running.
   */
  State cycle();
  // Cycles until the CPU stops, or `limit' instructions if limit >= 0.
  State run(long limit = -1);
  void reset();

  State state() const { return _state; }
  unsigned long instructions() const { return count; }
  void set_trace(FILE *out) { traceout = out; }

private:
  void execute(const Instruction &inst, uint16_t address);

  Memory &mem;
  RegisterFile &regs;
  TrapDispatcher &traps;
  State _state;
  unsigned long count;
  FILE *traceout;
};

}

#endif
