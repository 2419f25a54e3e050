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

#ifndef _LC3VM_MACHINE_HPP
#define _LC3VM_MACHINE_HPP

#include <stdio.h>
#include <string>
#include <vector>
#include <stdint.h>

#include "lc3vm/cpu.hpp"
#include "lc3vm/hardware.hpp"
#include "lc3vm/instruction.hpp"
#include "lc3vm/io.hpp"
#include "lc3vm/memory.hpp"
#include "lc3vm/registers.hpp"
#include "lc3vm/traps.hpp"

namespace LC3VM {

// What a debugger front end gets to see between two steps.
struct Snapshot
{
  uint16_t pc;
  uint16_t registers[RegisterFile::COUNT];
  Flags flags;
  State state;
  unsigned long instructions;
  uint16_t ir;         // word at pc
  bool decodable;      // false if ir holds the reserved opcode
  Instruction next;    // meaningful only if decodable
};

/*
 * One emulated machine. Owns all of its state, so several machines can
 * live in one process without sharing anything but the I/O objects the
 * caller hands in.
 */
class Machine
{
public:
  Machine(InputSource &input, OutputSink &output);

  // Loading places the program and points PC at its origin.
  uint16_t load_file(const std::string &filename);
  uint16_t load_image(const std::vector<uint8_t> &bytes);
  void load(uint16_t origin, const std::vector<uint16_t> &words);

  // Never has device side effects and never throws.
  Snapshot snapshot() const;
  // Exactly one CPU cycle. Errors propagate after freezing the machine.
  State step();
  State run(long limit = -1);

  uint16_t peek(uint16_t address) const { return mem.peek(address); }
  std::string disassemble(uint16_t address) const;

  State state() const { return cpu.state(); }
  void set_trace(FILE *out) { cpu.set_trace(out); }

  Memory &memory() { return mem; }
  RegisterFile &registers() { return regs; }
  Hardware &hardware() { return hw; }

private:
  Machine(const Machine &);
  Machine &operator=(const Machine &);

  void start_at(uint16_t origin);

  Memory mem;
  RegisterFile regs;
  Hardware hw;
  TrapDispatcher traps;
  CPU cpu;
};

}

#endif
