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
#include "lc3vm/memory.hpp"
#include "lc3vm/registers.hpp"
#include "lc3vm/traps.hpp"

using namespace LC3VM;

class TrapsTest : public ::testing::Test
{
protected:
  TrapsTest() : traps(mem, regs, input, output) {
    // as if the TRAP at 0x3000 was just fetched
    regs.set_pc(0x3001);
  }

  void string_at(uint16_t address, const char *str) {
    for (; *str; str++) {
      mem.write(address++, (uint8_t)*str);
    }
    mem.write(address, 0);
  }

  Memory mem;
  RegisterFile regs;
  BufferInput input;
  BufferOutput output;
  TrapDispatcher traps;
};

TEST_F(TrapsTest, Names)
{
  EXPECT_STREQ("GETC", trap_name(0x20));
  EXPECT_STREQ("PUTSP", trap_name(0x24));
  EXPECT_STREQ("HALT", trap_name(0x25));
  EXPECT_TRUE(trap_name(0x26) == NULL);
  EXPECT_TRUE(trap_name(0x00) == NULL);
}

TEST_F(TrapsTest, GetcReadsWithoutEcho)
{
  input.append("xy");
  EXPECT_EQ(TrapContinue, traps.dispatch(TRAP_GETC));
  EXPECT_EQ('x', regs.get(0));
  EXPECT_EQ("", output.str());
}

TEST_F(TrapsTest, GetcFlushesPendingOutput)
{
  input.append("a");
  traps.dispatch(TRAP_GETC);
  EXPECT_EQ(1, output.flush_count());
}

TEST_F(TrapsTest, GetcAtEndOfInput)
{
  regs.set(0, 0x1234);
  try {
    traps.dispatch(TRAP_GETC);
    FAIL() << "expected InputExhausted";
  } catch (Error &e) {
    EXPECT_EQ(InputExhausted, e.kind());
    EXPECT_EQ(0x3000, e.pc());
  }
  EXPECT_EQ(0x1234, regs.get(0));
}

TEST_F(TrapsTest, OutWritesLowByte)
{
  regs.set(0, 0x4142);
  traps.dispatch(TRAP_OUT);
  EXPECT_EQ("B", output.str());
}

TEST_F(TrapsTest, OutLeavesFlagsAlone)
{
  regs.update_flags(0x8000);
  regs.set(0, 'A');
  traps.dispatch(TRAP_OUT);
  EXPECT_EQ(FL_NEG, regs.flags());
}

TEST_F(TrapsTest, Puts)
{
  string_at(0x4000, "Hello, world!\n");
  regs.set(0, 0x4000);
  traps.dispatch(TRAP_PUTS);
  EXPECT_EQ("Hello, world!\n", output.str());
}

TEST_F(TrapsTest, PutsEmptyString)
{
  mem.write(0x4000, 0);
  regs.set(0, 0x4000);
  traps.dispatch(TRAP_PUTS);
  EXPECT_EQ("", output.str());
}

TEST_F(TrapsTest, PutsWrapsAroundMemory)
{
  mem.write(0xFFFF, 'A');
  mem.write(0x0000, 'B');
  mem.write(0x0001, 0);
  regs.set(0, 0xFFFF);
  traps.dispatch(TRAP_PUTS);
  EXPECT_EQ("AB", output.str());
}

TEST_F(TrapsTest, InPromptsAndEchoes)
{
  input.append("q");
  traps.dispatch(TRAP_IN);
  EXPECT_EQ("Enter a character: q", output.str());
  EXPECT_EQ('q', regs.get(0));
}

TEST_F(TrapsTest, PutspLowByteFirst)
{
  mem.write(0x4000, 'e' << 8 | 'H');
  mem.write(0x4001, 'l' << 8 | 'l');
  mem.write(0x4002, 'o');            // odd length, high byte zero
  mem.write(0x4003, 0);
  regs.set(0, 0x4000);
  traps.dispatch(TRAP_PUTSP);
  EXPECT_EQ("Hello", output.str());
}

TEST_F(TrapsTest, HaltFlushesAndWritesNothing)
{
  EXPECT_EQ(TrapHalt, traps.dispatch(TRAP_HALT));
  EXPECT_EQ("", output.str());
  EXPECT_EQ(1, output.flush_count());
}

TEST_F(TrapsTest, UnknownVector)
{
  try {
    traps.dispatch(0x26);
    FAIL() << "expected InvalidTrap";
  } catch (Error &e) {
    EXPECT_EQ(InvalidTrap, e.kind());
    EXPECT_EQ(0x3000, e.pc());
  }
}

TEST_F(TrapsTest, TrapsDoNotTouchR7)
{
  regs.set(7, 0xBEEF);
  regs.set(0, 'z');
  traps.dispatch(TRAP_OUT);
  traps.dispatch(TRAP_HALT);
  EXPECT_EQ(0xBEEF, regs.get(7));
}
