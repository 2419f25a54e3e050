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

#ifndef _LC3VM_INSTRUCTION_HPP
#define _LC3VM_INSTRUCTION_HPP

#include <string>
#include <stdint.h>

namespace LC3VM {

// Bits [15..12] of an instruction word.
enum Opcode
{
  OP_BR = 0,
  OP_ADD,
  OP_LD,
  OP_ST,
  OP_JSR,
  OP_AND,
  OP_LDR,
  OP_STR,
  OP_RTI,
  OP_NOT,
  OP_LDI,
  OP_STI,
  OP_JMP,
  OP_RES,
  OP_LEA,
  OP_TRAP
};

// BR: n/z/p mask in bits [11..9]
struct BranchOperands
{
  uint8_t nzp;
  uint16_t offset9;
};

// ADD, AND
struct AluOperands
{
  uint8_t dr;
  uint8_t sr1;
  bool immediate;
  uint8_t sr2;
  uint16_t imm5;
};

// NOT
struct UnaryOperands
{
  uint8_t dr;
  uint8_t sr;
};

// LD, LDI, LEA (reg is DR) and ST, STI (reg is SR)
struct PcRelativeOperands
{
  uint8_t reg;
  uint16_t offset9;
};

// LDR (reg is DR) and STR (reg is SR)
struct BaseOffsetOperands
{
  uint8_t reg;
  uint8_t base;
  uint16_t offset6;
};

// JMP, RET
struct JumpOperands
{
  uint8_t base;
};

// JSR when long_form is set, JSRR otherwise
struct SubroutineOperands
{
  bool long_form;
  uint16_t offset11;
  uint8_t base;
};

struct TrapOperands
{
  uint8_t vector;
};

/*
 * A decoded instruction. `opcode' tags which member of the operand union
 * is meaningful; RTI carries no operands and OP_RES is never produced by
 * decode(). Offsets and immediates are already sign extended.
 */
struct Instruction
{
  Opcode opcode;
  uint16_t raw;
  union {
    BranchOperands br;
    AluOperands alu;
    UnaryOperands unary;
    PcRelativeOperands pcrel;
    BaseOffsetOperands based;
    JumpOperands jmp;
    SubroutineOperands jsr;
    TrapOperands trap;
  };
};

const char *opcode_name(Opcode op);

// Throws Error(InvalidOpcode) for the reserved opcode. `address' is only
// used to report where the word came from.
Instruction decode(uint16_t word, uint16_t address = 0);

// Canonical instruction word for a decoded instruction.
uint16_t encode(const Instruction &inst);

// Assembly text, PC relative targets resolved against `address', the
// location the instruction was fetched from.
std::string disassemble(const Instruction &inst, uint16_t address);

}

#endif
