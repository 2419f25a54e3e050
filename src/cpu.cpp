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

#include <stdio.h>
#include "lc3vm/cpu.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

const char *state_name(State state)
{
  switch (state) {
  case Running: return "Running";
  case Halted:  return "Halted";
  case Faulted: return "Faulted";
  }
  return "?";
}

CPU::CPU(Memory &mem, RegisterFile &regs, TrapDispatcher &traps) :
  mem(mem), regs(regs), traps(traps), _state(Running), count(0), traceout(0)
{
}

void CPU::reset()
{
  _state = Running;
  count = 0;
}

State CPU::cycle()
{
  if (_state != Running) {
    return _state;
  }

  uint16_t address = regs.pc();
  try {
    uint16_t IR = mem.read(address);
    regs.set_pc(address + 1);
    Instruction inst = decode(IR, address);
    if (traceout) {
      fprintf(traceout, "%.4x: %.4x  %s\n", address, IR,
	      disassemble(inst, address).c_str());
    }
    execute(inst, address);
    count++;
  } catch (Error &e) {
    _state = Faulted;
    if (traceout) {
      fprintf(traceout, "%s\n", e.what());
    }
    throw;
  }

  return _state;
}

State CPU::run(long limit)
{
  while (_state == Running && limit != 0) {
    if (limit > 0) {
      limit--;
    }
    cycle();
  }
  return _state;
}

void CPU::execute(const Instruction &inst, uint16_t address)
{
  uint16_t PC = regs.pc();

  switch (inst.opcode) {
  case OP_BR:
    if (inst.br.nzp & regs.flags()) {
      regs.set_pc(PC + inst.br.offset9);
    }
    break;

  case OP_ADD:
  case OP_AND:
    {
      uint16_t a = regs.get(inst.alu.sr1);
      uint16_t b = inst.alu.immediate ? inst.alu.imm5 : regs.get(inst.alu.sr2);
      uint16_t result = inst.opcode == OP_ADD ? a + b : a & b;
      regs.set(inst.alu.dr, result);
      regs.update_flags(result);
    }
    break;

  case OP_NOT:
    {
      uint16_t result = ~regs.get(inst.unary.sr);
      regs.set(inst.unary.dr, result);
      regs.update_flags(result);
    }
    break;

  case OP_LD:
    {
      uint16_t value = mem.read(PC + inst.pcrel.offset9);
      regs.set(inst.pcrel.reg, value);
      regs.update_flags(value);
    }
    break;

  case OP_LDI:
    {
      uint16_t value = mem.read(mem.read(PC + inst.pcrel.offset9));
      regs.set(inst.pcrel.reg, value);
      regs.update_flags(value);
    }
    break;

  case OP_LDR:
    {
      uint16_t value = mem.read(regs.get(inst.based.base) + inst.based.offset6);
      regs.set(inst.based.reg, value);
      regs.update_flags(value);
    }
    break;

  case OP_LEA:
    {
      uint16_t value = PC + inst.pcrel.offset9;
      regs.set(inst.pcrel.reg, value);
      regs.update_flags(value);
    }
    break;

  case OP_ST:
    mem.write(PC + inst.pcrel.offset9, regs.get(inst.pcrel.reg));
    break;

  case OP_STI:
    mem.write(mem.read(PC + inst.pcrel.offset9), regs.get(inst.pcrel.reg));
    break;

  case OP_STR:
    mem.write(regs.get(inst.based.base) + inst.based.offset6,
	      regs.get(inst.based.reg));
    break;

  case OP_JMP:
    regs.set_pc(regs.get(inst.jmp.base));
    break;

  case OP_JSR:
    {
      // read the base before R7 is overwritten (JSRR R7)
      uint16_t target = inst.jsr.long_form
	? (uint16_t)(PC + inst.jsr.offset11)
	: regs.get(inst.jsr.base);
      regs.set(7, PC);
      regs.set_pc(target);
    }
    break;

  case OP_TRAP:
    if (traps.dispatch(inst.trap.vector) == TrapHalt) {
      _state = Halted;
    }
    break;

  case OP_RTI:
    throw Error(IllegalInstruction, address, "RTI is not supported");

  case OP_RES:
    throw Error(InvalidOpcode, address);
  }
}

}
