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

#include "lc3vm/breakpoints.hpp"

using namespace LC3VM;

using ::testing::internal::CaptureStdout;
using ::testing::internal::GetCapturedStdout;

class BreakpointsTest : public ::testing::Test
{
protected:
  // Breakpoint commands report to stdout, keep the test log clean.
  void SetUp() { CaptureStdout(); }
  void TearDown() { GetCapturedStdout(); }

  UserBreakpoints bp;
};

TEST_F(BreakpointsTest, AddAssignsIncreasingIds)
{
  EXPECT_EQ(1, bp.add(0x3000, false));
  EXPECT_EQ(2, bp.add(0x3004, false));
  EXPECT_EQ(2u, bp.size());
}

TEST_F(BreakpointsTest, DuplicateAddressRejected)
{
  EXPECT_EQ(1, bp.add(0x3000, false));
  EXPECT_EQ(-1, bp.add(0x3000, true));
  EXPECT_EQ(1u, bp.size());
}

TEST_F(BreakpointsTest, CheckStopsAtAddress)
{
  int id = bp.add(0x3004, false);
  EXPECT_EQ(0, bp.check(0x3003));
  EXPECT_EQ(id, bp.check(0x3004));
  EXPECT_EQ(id, bp.check(0x3004));
  EXPECT_EQ(2, bp.find(id)->hits);
}

TEST_F(BreakpointsTest, TemporaryBreakpointDeletedOnHit)
{
  int id = bp.add(0x3004, true);
  EXPECT_EQ(id, bp.check(0x3004));
  EXPECT_EQ(0u, bp.size());
  EXPECT_EQ(0, bp.check(0x3004));
}

TEST_F(BreakpointsTest, DisabledBreakpointDoesNotStop)
{
  int id = bp.add(0x3004, false);
  EXPECT_EQ(id, bp.setEnabled(id, false, false, Keep));
  EXPECT_EQ(0, bp.check(0x3004));
  EXPECT_FALSE(bp.find(id)->enabled);

  bp.setEnabled(id, true, false, Keep);
  EXPECT_EQ(id, bp.check(0x3004));
}

TEST_F(BreakpointsTest, EnableOnce)
{
  int id = bp.add(0x3004, false);
  bp.setEnabled(id, true, true, Disable);
  EXPECT_EQ(id, bp.check(0x3004));
  EXPECT_EQ(0, bp.check(0x3004));
  EXPECT_EQ(1u, bp.size());
}

TEST_F(BreakpointsTest, IgnoreCount)
{
  int id = bp.add(0x3004, false);
  EXPECT_EQ(id, bp.setIgnoreCount(id, 2));
  EXPECT_EQ(0, bp.check(0x3004));
  EXPECT_EQ(0, bp.check(0x3004));
  EXPECT_EQ(id, bp.check(0x3004));
  EXPECT_EQ(3, bp.find(id)->hits);
}

TEST_F(BreakpointsTest, EraseUnknownId)
{
  EXPECT_EQ(-1, bp.erase(42));
  EXPECT_EQ(-1, bp.setEnabled(42, true, false, Keep));
  EXPECT_EQ(-1, bp.setIgnoreCount(42, 1));
}

TEST_F(BreakpointsTest, EraseRemovesBreakpoint)
{
  int id = bp.add(0x3004, false);
  EXPECT_EQ(id, bp.erase(id));
  EXPECT_EQ(0, bp.check(0x3004));
  EXPECT_TRUE(bp.find(id) == NULL);

  // address can be reused, ids are not
  EXPECT_EQ(id + 1, bp.add(0x3004, false));
}

TEST(BreakpointsMessages, Listing)
{
  UserBreakpoints bp;

  CaptureStdout();
  bp.showInfo();
  EXPECT_EQ("No breakpoints.\n", GetCapturedStdout());

  CaptureStdout();
  int id = bp.add(0x3004, false);
  EXPECT_EQ("Breakpoint 1 at 0x3004.\n", GetCapturedStdout());

  CaptureStdout();
  bp.add(0x3010, true);
  bp.check(0x3004);
  bp.setEnabled(id, false, true, Disable);
  bp.showInfo();
  std::string out = GetCapturedStdout();
  EXPECT_NE(std::string::npos, out.find("Temporary breakpoint 2 at 0x3010."));
  EXPECT_NE(std::string::npos, out.find("Breakpoint 1, 0x3004."));
  EXPECT_NE(std::string::npos, out.find("Num     Type           Disp Enb Address"));
  EXPECT_NE(std::string::npos, out.find("1       breakpoint     dis  n   0x3004"));
  EXPECT_NE(std::string::npos, out.find("2       breakpoint     del  y   0x3010"));
  EXPECT_NE(std::string::npos, out.find("breakpoint already hit 1 times"));
}
