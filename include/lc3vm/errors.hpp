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

#ifndef _LC3VM_ERRORS_HPP
#define _LC3VM_ERRORS_HPP

#include <exception>
#include <string>
#include <stdint.h>

namespace LC3VM {

enum ErrorKind
{
  InvalidOpcode,      // reserved opcode 1101
  IllegalInstruction, // RTI, not supported without privilege modes
  InvalidTrap,
  ImageLoadOverflow,
  InputExhausted,
  ImageUnreadable
};

const char *error_kind_name(ErrorKind kind);

/*
 * Every error is fatal to the current run. `pc' is the address of the
 * instruction being executed when the error was raised (or the load
 * origin for image errors).
 */
class Error : public std::exception
{
public:
  Error(ErrorKind kind, uint16_t pc, const std::string &detail = "");
  virtual ~Error() throw() { }

  ErrorKind kind() const { return _kind; }
  uint16_t pc() const { return _pc; }
  const char *what() const throw() { return message.c_str(); }

private:
  ErrorKind _kind;
  uint16_t _pc;
  std::string message;
};

}

#endif
