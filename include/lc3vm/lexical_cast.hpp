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

#ifndef _LC3VM_LEXICAL_CAST_HPP
#define _LC3VM_LEXICAL_CAST_HPP

#include <exception>
#include <string>
#include <cstdlib>
#include <typeinfo>
#include <stdint.h>

namespace LC3VM {

class bad_lexical_cast : public std::bad_cast { 
public:
  const char *what() const throw () {
    return "Bad Lexical Cast";
  }
};

template <typename Target> 
Target lexical_cast(const std::string &arg);
template <typename Target> 
Target lexical_cast(const char *arg);

// Accepts the lc3 notations x3000 and #12 besides C style 0x3000 and 12.
inline long parse_lc3_number(const char *str, long min, long max)
{
  char *end = 0;
  int base = 0;
  if ((str[0]|0x20)=='x') {	// handle the lc3 hex (x1234)
	  str++;
	  base = 16;
  } else if (str[0]=='#') {	// and the lc3 decimal (#1234)
	  str++;
	  base = 10;
  }
  long value = strtol(str, &end, base);
  if (!end || *end || value > max || value < min || end == str) {
    throw bad_lexical_cast();
  }
  return value;
}

template<>
inline uint16_t lexical_cast<uint16_t>(const char *str)
{
  return parse_lc3_number(str, 0, 0xFFFF) & 0xFFFF;
}

template<>
inline int16_t lexical_cast<int16_t>(const char * str)
{
  return (int16_t)(parse_lc3_number(str, -0x8000, 0xFFFF) & 0xFFFF);
}

template<>
inline int lexical_cast<int>(const char * str)
{
  return (int)parse_lc3_number(str, 0, 0x7FFFFFFF);
}

template<>
inline uint16_t lexical_cast<uint16_t>(const std::string &str)
{
  return lexical_cast<uint16_t>(str.c_str());
}

template<>
inline int16_t lexical_cast<int16_t>(const std::string &str)
{
  return lexical_cast<int16_t>(str.c_str());
}

template<>
inline int lexical_cast<int>(const std::string &str)
{
  return lexical_cast<int>(str.c_str());
}

}

#endif
