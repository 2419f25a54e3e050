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

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lc3vm/errors.hpp"
#include "lc3vm/io.hpp"
#include "lc3vm/machine.hpp"

using namespace LC3VM;

static std::vector<uint16_t> words(const uint16_t *begin, size_t n)
{
  return std::vector<uint16_t>(begin, begin + n);
}

static std::vector<uint8_t> image(uint16_t origin, const uint16_t *body, size_t n)
{
  std::vector<uint8_t> bytes;
  bytes.push_back(origin >> 8);
  bytes.push_back(origin & 0xFF);
  for (size_t i = 0; i < n; i++) {
    bytes.push_back(body[i] >> 8);
    bytes.push_back(body[i] & 0xFF);
  }
  return bytes;
}

class MachineTest : public ::testing::Test
{
protected:
  MachineTest() : machine(input, output) { }

  BufferInput input;
  BufferOutput output;
  Machine machine;
};

TEST_F(MachineTest, LoadImageSetsPC)
{
  const uint16_t body[] = { 0xF025 };
  EXPECT_EQ(0x3000, machine.load_image(image(0x3000, body, 1)));
  Snapshot s = machine.snapshot();
  EXPECT_EQ(0x3000, s.pc);
  EXPECT_EQ(Running, s.state);
  EXPECT_EQ(0xF025, s.ir);
  ASSERT_TRUE(s.decodable);
  EXPECT_EQ(OP_TRAP, s.next.opcode);
}

TEST_F(MachineTest, InitialRegisters)
{
  Snapshot s = machine.snapshot();
  for (int i = 0; i < RegisterFile::COUNT; i++) {
    EXPECT_EQ(0, s.registers[i]);
  }
  EXPECT_EQ(FL_ZRO, s.flags);
  EXPECT_EQ(0u, s.instructions);
}

TEST_F(MachineTest, HelloProgram)
{
  const uint16_t program[] = {
    0xE002,   // LEA R0, x3003
    0xF022,   // PUTS
    0xF025,   // HALT
    'H', 'I', 0
  };
  machine.load(0x3000, words(program, 6));
  EXPECT_EQ(Halted, machine.run());
  EXPECT_EQ("HI", output.str());
  EXPECT_EQ(3u, machine.snapshot().instructions);
}

TEST_F(MachineTest, KeyboardPolling)
{
  const uint16_t program[] = {
    0xA204,   // LDI R1, x3005    KBSR
    0x07FE,   // BRzp x3000
    0xA003,   // LDI R0, x3006    KBDR
    0xF021,   // OUT
    0xF025,   // HALT
    0xFE00,
    0xFE02
  };
  input.append("k");
  machine.load(0x3000, words(program, 7));
  EXPECT_EQ(Halted, machine.run());
  EXPECT_EQ("k", output.str());
  EXPECT_FALSE(machine.hardware().key_ready());
}

TEST_F(MachineTest, KeyEventWithoutInput)
{
  const uint16_t program[] = { 0xA204, 0x07FE, 0xA003, 0xF021, 0xF025, 0xFE00, 0xFE02 };
  machine.load(0x3000, words(program, 7));

  // nothing typed yet: the loop keeps polling
  EXPECT_EQ(Running, machine.run(20));
  EXPECT_EQ("", output.str());

  machine.hardware().key_event('!');
  EXPECT_EQ(Halted, machine.run(20));
  EXPECT_EQ("!", output.str());
}

TEST_F(MachineTest, EchoProgramReadsEveryCharacter)
{
  const uint16_t program[] = {
    0xF020,   // GETC
    0xF021,   // OUT
    0x0FFD    // BRnzp x3000
  };
  input.append("abc");
  machine.load(0x3000, words(program, 3));
  try {
    machine.run();
    FAIL() << "expected InputExhausted";
  } catch (Error &e) {
    EXPECT_EQ(InputExhausted, e.kind());
    EXPECT_EQ(0x3000, e.pc());
  }
  EXPECT_EQ("abc", output.str());
  EXPECT_EQ(Faulted, machine.state());
}

TEST_F(MachineTest, SnapshotHasNoSideEffects)
{
  const uint16_t program[] = { 0xA001, 0xF025, 0xFE00 };
  input.append("z");
  machine.load(0xFDFF, words(program, 1));

  Snapshot before = machine.snapshot();
  for (int i = 0; i < 5; i++) {
    machine.snapshot();
    machine.peek(0xFE00);
    machine.disassemble(0xFE02);
  }
  Snapshot after = machine.snapshot();
  EXPECT_EQ(before.pc, after.pc);
  EXPECT_EQ(before.instructions, after.instructions);
  EXPECT_EQ(0, machine.peek(0xFE00));
  EXPECT_FALSE(machine.hardware().key_ready());
  EXPECT_TRUE(input.available());
}

TEST_F(MachineTest, ReservedOpcodeFaults)
{
  const uint16_t program[] = { 0xD000, 0xF025 };
  machine.load(0x3000, words(program, 2));

  Snapshot s = machine.snapshot();
  EXPECT_FALSE(s.decodable);
  EXPECT_EQ(".FILL xD000", machine.disassemble(0x3000));

  try {
    machine.step();
    FAIL() << "expected InvalidOpcode";
  } catch (Error &e) {
    EXPECT_EQ(InvalidOpcode, e.kind());
    EXPECT_EQ(0x3000, e.pc());
  }
  EXPECT_EQ(Faulted, machine.state());
  EXPECT_EQ(0x3001, machine.snapshot().pc);

  // frozen until the next load
  EXPECT_EQ(Faulted, machine.step());
  EXPECT_EQ(0x3001, machine.snapshot().pc);

  machine.load(0x3000, words(program + 1, 1));
  EXPECT_EQ(Running, machine.state());
  EXPECT_EQ(Halted, machine.step());
}

TEST_F(MachineTest, OverflowingImageIsRejected)
{
  const uint16_t body[] = { 1, 2, 3 };
  machine.memory().write(0xFFFE, 0x1111);
  try {
    machine.load_image(image(0xFFFE, body, 3));
    FAIL() << "expected ImageLoadOverflow";
  } catch (Error &e) {
    EXPECT_EQ(ImageLoadOverflow, e.kind());
  }
  EXPECT_EQ(0x1111, machine.peek(0xFFFE));
}

TEST_F(MachineTest, MissingFile)
{
  try {
    machine.load_file("/nonexistent/program.obj");
    FAIL() << "expected ImageUnreadable";
  } catch (Error &e) {
    EXPECT_EQ(ImageUnreadable, e.kind());
  }
}

TEST_F(MachineTest, MachinesAreIndependent)
{
  BufferInput other_input;
  BufferOutput other_output;
  Machine other(other_input, other_output);

  const uint16_t program[] = { 0x1021, 0xF025 };   // ADD R0, R0, #1
  machine.load(0x3000, words(program, 2));
  other.load(0x4000, words(program, 2));

  machine.run();
  EXPECT_EQ(1, machine.snapshot().registers[0]);
  EXPECT_EQ(0, other.snapshot().registers[0]);
  EXPECT_EQ(0x4000, other.snapshot().pc);
  EXPECT_EQ(0, other.peek(0x3000));
}

TEST_F(MachineTest, DisassembleUsesAddress)
{
  const uint16_t program[] = { 0x0FFF };
  machine.load(0x3000, words(program, 1));
  EXPECT_EQ("BR x3000", machine.disassemble(0x3000));
}
