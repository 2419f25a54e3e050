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
#include <string.h>
#include "lc3vm/machine.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

Machine::Machine(InputSource &input, OutputSink &output) :
  hw(mem, input),
  traps(mem, regs, input, output),
  cpu(mem, regs, traps)
{
}

void Machine::start_at(uint16_t origin)
{
  regs.set_pc(origin);
  cpu.reset();
}

uint16_t Machine::load_file(const std::string &filename)
{
  uint16_t origin = mem.load_file(filename);
  start_at(origin);
  return origin;
}

uint16_t Machine::load_image(const std::vector<uint8_t> &bytes)
{
  uint16_t origin = mem.load_image(bytes);
  start_at(origin);
  return origin;
}

void Machine::load(uint16_t origin, const std::vector<uint16_t> &words)
{
  mem.load(origin, words);
  start_at(origin);
}

Snapshot Machine::snapshot() const
{
  Snapshot s;
  memset(&s, 0, sizeof(s));

  s.pc = regs.pc();
  for (int i = 0; i < RegisterFile::COUNT; i++) {
    s.registers[i] = regs.get(i);
  }
  s.flags = regs.flags();
  s.state = cpu.state();
  s.instructions = cpu.instructions();
  s.ir = mem.peek(s.pc);
  try {
    s.next = decode(s.ir, s.pc);
    s.decodable = true;
  } catch (Error &e) {
    // reported as not decodable, the error itself surfaces on step()
    s.decodable = false;
  }

  return s;
}

State Machine::step()
{
  return cpu.cycle();
}

State Machine::run(long limit)
{
  return cpu.run(limit);
}

std::string Machine::disassemble(uint16_t address) const
{
  uint16_t word = mem.peek(address);
  try {
    return LC3VM::disassemble(decode(word, address), address);
  } catch (Error &e) {
    char buf[16];
    snprintf(buf, sizeof(buf), ".FILL x%.4X", word);
    return buf;
  }
}

}
