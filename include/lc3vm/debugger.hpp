/*\
 *  LC-3 VM
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
 *  Copyright (C) 2004  Ehren Kret <kret@cs.utexas.edu>
 *  Copyright (C) 2010-2011  Edgar Lakis <edgar.lakis@gmail.com>
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

#ifndef _LC3VM_DEBUGGER_HPP
#define _LC3VM_DEBUGGER_HPP

#include <deque>
#include <string>
#include <stdint.h>

#include "lc3vm/breakpoints.hpp"
#include "lc3vm/machine.hpp"

namespace LC3VM {

// SIGINT stops a running program instead of killing the process.
void catch_interrupts();
// True once per received SIGINT.
bool take_interrupt();

/*
 * gdb like command line debugger. Talks to the machine only through
 * snapshot(), step(), peek() and disassemble().
 */
class Debugger
{
public:
  enum { HISTORY_SIZE = 64 };

  Debugger(Machine &machine, bool quiet_mode, const char *exec_file = NULL);

  // readline loop until `quit' or end of input
  int interact();
  // Runs one command line. Returns false when the session should end.
  bool command(const std::string &cmdline);

  UserBreakpoints &breakpoints() { return _breakpoints; }
  // Disassembly of the executed instructions, oldest first.
  const std::deque<std::string> &history() const { return op_history; }

private:
  // Executes up to count instructions (all if negative). Stops early on
  // halt, fault, breakpoint, SIGINT or when PC reaches stop_at.
  void resume(long count, int stop_at = -1, bool stop_on_return = false);
  void show_execution_position();
  void print_registers();
  void dump(uint16_t first, uint16_t last);
  void dasm(uint16_t first, uint16_t last);
  void print_history(size_t count);

  Machine &machine;
  bool quiet_mode;
  std::string exec_file;
  UserBreakpoints _breakpoints;
  std::string last_cmd;
  std::deque<std::string> op_history;
};

}

#endif
