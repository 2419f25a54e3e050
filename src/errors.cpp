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
#include "lc3vm/errors.hpp"

namespace LC3VM {

const char *error_kind_name(ErrorKind kind)
{
  switch (kind) {
  case InvalidOpcode:      return "InvalidOpcode";
  case IllegalInstruction: return "IllegalInstruction";
  case InvalidTrap:        return "InvalidTrap";
  case ImageLoadOverflow:  return "ImageLoadOverflow";
  case InputExhausted:     return "InputExhausted";
  case ImageUnreadable:    return "ImageUnreadable";
  }
  return "UnknownError";
}

Error::Error(ErrorKind kind, uint16_t pc, const std::string &detail)
  : _kind(kind), _pc(pc)
{
  char buf[64];
  snprintf(buf, sizeof(buf), "%s at 0x%.4x", error_kind_name(kind), pc);
  message = buf;
  if (!detail.empty()) {
    message += ": ";
    message += detail;
  }
}

}
