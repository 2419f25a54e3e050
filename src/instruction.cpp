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
#include "lc3vm/instruction.hpp"
#include "lc3vm/errors.hpp"
#include "lc3vm/traps.hpp"
#include "lc3vm/util.hpp"

namespace LC3VM {

const char *opcode_name(Opcode op)
{
  static const char *names[] = {
    "BR", "ADD", "LD", "ST", "JSR", "AND", "LDR", "STR",
    "RTI", "NOT", "LDI", "STI", "JMP", "RES", "LEA", "TRAP"
  };
  return names[op & 0xF];
}

Instruction decode(uint16_t IR, uint16_t address)
{
  Instruction inst;
  memset(&inst, 0, sizeof(inst));
  inst.opcode = (Opcode)zext(IR, 15, 12);
  inst.raw = IR;

  switch (inst.opcode) {
  case OP_BR:
    inst.br.nzp = zext(IR, 11, 9);
    inst.br.offset9 = sext(IR, 8, 0);
    break;
  case OP_ADD:
  case OP_AND:
    inst.alu.dr = zext(IR, 11, 9);
    inst.alu.sr1 = zext(IR, 8, 6);
    inst.alu.immediate = zext(IR, 5, 5);
    if (inst.alu.immediate) {
      inst.alu.imm5 = sext(IR, 4, 0);
    } else {
      inst.alu.sr2 = zext(IR, 2, 0);
    }
    break;
  case OP_NOT:
    inst.unary.dr = zext(IR, 11, 9);
    inst.unary.sr = zext(IR, 8, 6);
    break;
  case OP_LD:
  case OP_LDI:
  case OP_LEA:
  case OP_ST:
  case OP_STI:
    inst.pcrel.reg = zext(IR, 11, 9);
    inst.pcrel.offset9 = sext(IR, 8, 0);
    break;
  case OP_LDR:
  case OP_STR:
    inst.based.reg = zext(IR, 11, 9);
    inst.based.base = zext(IR, 8, 6);
    inst.based.offset6 = sext(IR, 5, 0);
    break;
  case OP_JMP:
    inst.jmp.base = zext(IR, 8, 6);
    break;
  case OP_JSR:
    inst.jsr.long_form = zext(IR, 11, 11);
    if (inst.jsr.long_form) {
      inst.jsr.offset11 = sext(IR, 10, 0);
    } else {
      inst.jsr.base = zext(IR, 8, 6);
    }
    break;
  case OP_TRAP:
    inst.trap.vector = zext(IR, 7, 0);
    break;
  case OP_RTI:
    break;
  case OP_RES:
    {
      char buf[32];
      snprintf(buf, sizeof(buf), "reserved opcode in x%.4X", IR);
      throw Error(InvalidOpcode, address, buf);
    }
  }

  return inst;
}

uint16_t encode(const Instruction &inst)
{
  uint16_t IR = inst.opcode << 12;

  switch (inst.opcode) {
  case OP_BR:
    IR |= (inst.br.nzp & 0x7) << 9 | (inst.br.offset9 & mask(9));
    break;
  case OP_ADD:
  case OP_AND:
    IR |= (inst.alu.dr & 0x7) << 9 | (inst.alu.sr1 & 0x7) << 6;
    if (inst.alu.immediate) {
      IR |= 0x20 | (inst.alu.imm5 & mask(5));
    } else {
      IR |= inst.alu.sr2 & 0x7;
    }
    break;
  case OP_NOT:
    IR |= (inst.unary.dr & 0x7) << 9 | (inst.unary.sr & 0x7) << 6 | 0x3F;
    break;
  case OP_LD:
  case OP_LDI:
  case OP_LEA:
  case OP_ST:
  case OP_STI:
    IR |= (inst.pcrel.reg & 0x7) << 9 | (inst.pcrel.offset9 & mask(9));
    break;
  case OP_LDR:
  case OP_STR:
    IR |= (inst.based.reg & 0x7) << 9 | (inst.based.base & 0x7) << 6
      | (inst.based.offset6 & mask(6));
    break;
  case OP_JMP:
    IR |= (inst.jmp.base & 0x7) << 6;
    break;
  case OP_JSR:
    if (inst.jsr.long_form) {
      IR |= 0x0800 | (inst.jsr.offset11 & mask(11));
    } else {
      IR |= (inst.jsr.base & 0x7) << 6;
    }
    break;
  case OP_TRAP:
    IR |= inst.trap.vector;
    break;
  case OP_RTI:
    break;
  case OP_RES:
    throw Error(InvalidOpcode, 0, "reserved opcode has no encoding");
  }

  return IR;
}

std::string disassemble(const Instruction &inst, uint16_t address)
{
  char buf[64] = "";
  // PC relative operands are relative to the incremented PC
  uint16_t next = address + 1;

  switch (inst.opcode) {
  case OP_BR:
    if (inst.br.nzp == 0) {
      snprintf(buf, sizeof(buf), "NOP");
    } else {
      snprintf(buf, sizeof(buf), "BR%s%s%s x%.4X",
	       (inst.br.nzp & 4 && inst.br.nzp != 7) ? "n" : "",
	       (inst.br.nzp & 2 && inst.br.nzp != 7) ? "z" : "",
	       (inst.br.nzp & 1 && inst.br.nzp != 7) ? "p" : "",
	       (uint16_t)(next + inst.br.offset9));
    }
    break;
  case OP_ADD:
  case OP_AND:
    if (inst.alu.immediate) {
      snprintf(buf, sizeof(buf), "%s R%d, R%d, #%d", opcode_name(inst.opcode),
	       inst.alu.dr, inst.alu.sr1, as_signed(inst.alu.imm5));
    } else {
      snprintf(buf, sizeof(buf), "%s R%d, R%d, R%d", opcode_name(inst.opcode),
	       inst.alu.dr, inst.alu.sr1, inst.alu.sr2);
    }
    break;
  case OP_NOT:
    snprintf(buf, sizeof(buf), "NOT R%d, R%d", inst.unary.dr, inst.unary.sr);
    break;
  case OP_LD:
  case OP_LDI:
  case OP_LEA:
  case OP_ST:
  case OP_STI:
    snprintf(buf, sizeof(buf), "%s R%d, x%.4X", opcode_name(inst.opcode),
	     inst.pcrel.reg, (uint16_t)(next + inst.pcrel.offset9));
    break;
  case OP_LDR:
  case OP_STR:
    snprintf(buf, sizeof(buf), "%s R%d, R%d, #%d", opcode_name(inst.opcode),
	     inst.based.reg, inst.based.base, as_signed(inst.based.offset6));
    break;
  case OP_JMP:
    if (inst.jmp.base == 7) {
      snprintf(buf, sizeof(buf), "RET");
    } else {
      snprintf(buf, sizeof(buf), "JMP R%d", inst.jmp.base);
    }
    break;
  case OP_JSR:
    if (inst.jsr.long_form) {
      snprintf(buf, sizeof(buf), "JSR x%.4X", (uint16_t)(next + inst.jsr.offset11));
    } else {
      snprintf(buf, sizeof(buf), "JSRR R%d", inst.jsr.base);
    }
    break;
  case OP_TRAP:
    if (trap_name(inst.trap.vector)) {
      snprintf(buf, sizeof(buf), "%s", trap_name(inst.trap.vector));
    } else {
      snprintf(buf, sizeof(buf), "TRAP x%.2X", inst.trap.vector);
    }
    break;
  case OP_RTI:
    snprintf(buf, sizeof(buf), "RTI");
    break;
  case OP_RES:
    snprintf(buf, sizeof(buf), ".FILL x%.4X", inst.raw);
    break;
  }

  return buf;
}

}
