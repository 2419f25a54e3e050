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

#include "lc3vm/lexical_cast.hpp"

using namespace LC3VM;

TEST(LexicalCast, Lc3Notations)
{
  EXPECT_EQ(0x3000, lexical_cast<uint16_t>("x3000"));
  EXPECT_EQ(0x3000, lexical_cast<uint16_t>("X3000"));
  EXPECT_EQ(12, lexical_cast<uint16_t>("#12"));
}

TEST(LexicalCast, CNotations)
{
  EXPECT_EQ(0x3000, lexical_cast<uint16_t>("0x3000"));
  EXPECT_EQ(12, lexical_cast<uint16_t>("12"));
  EXPECT_EQ(0xFFFF, lexical_cast<uint16_t>(std::string("65535")));
}

TEST(LexicalCast, SignedWords)
{
  EXPECT_EQ(-1, lexical_cast<int16_t>("#-1"));
  EXPECT_EQ(-1, lexical_cast<int16_t>("xFFFF"));
  EXPECT_EQ(-32768, lexical_cast<int16_t>("-32768"));
}

TEST(LexicalCast, Counts)
{
  EXPECT_EQ(100, lexical_cast<int>("100"));
  EXPECT_EQ(16, lexical_cast<int>(std::string("x10")));
  EXPECT_THROW(lexical_cast<int>("-1"), bad_lexical_cast);
}

TEST(LexicalCast, Rejects)
{
  EXPECT_THROW(lexical_cast<uint16_t>(""), bad_lexical_cast);
  EXPECT_THROW(lexical_cast<uint16_t>("x"), bad_lexical_cast);
  EXPECT_THROW(lexical_cast<uint16_t>("x3000z"), bad_lexical_cast);
  EXPECT_THROW(lexical_cast<uint16_t>("x10000"), bad_lexical_cast);
  EXPECT_THROW(lexical_cast<uint16_t>("#-1"), bad_lexical_cast);
  EXPECT_THROW(lexical_cast<uint16_t>(std::string("regs")), bad_lexical_cast);
}
