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

#include <stdio.h>
#include <stdlib.h>
#include <signal.h>
#include <readline/readline.h>
#include <readline/history.h>
#include <sstream>
#include <iostream>
#include <iomanip>

#include "lc3vm/debugger.hpp"
#include "lc3vm/errors.hpp"
#include "lc3vm/lexical_cast.hpp"
#include "lc3vm/util.hpp"

namespace LC3VM {

const char * HELP_LIST =
"The list of available commands. The commands are described in following format:\n"
"       command|alias1|alias2 ARGUMENT [OPTIONAL_ARGUMENT]      -- description.\n"
"  The `|' denotes alternative command names.\n"
"  The WORDS_IN_CAPS denotes command arguments.\n"
"  The text between `[' and ']' characters denotes optional part of the command.\n"
"Use `help' command to get more information about particular command.\n"
"Addresses and counts may be given as x3000, 0x3000, #12 or 12.\n\n"

"  help|h [COMMAND]             -- Displays this help screen or help for the COMMAND\n"
"  load|file FILENAME.OBJ       -- Loads the FILENAME.OBJ and points PC at its origin\n"
"  quit|q|exit                  -- Quits the debugging session.\n"

"\n=== Running ===\n"
"  run|r                        -- Reloads the program and runs it\n"
"  continue|cont|c              -- Continue execution after breakpoint\n"
"  stepi|si|step|s [COUNT]      -- Executes the next COUNT instructions.\n"
"  nexti|ni|next|n              -- Steps over the next instruction (runs a JSR/JSRR call to its return)\n"
"  finish                       -- Continue until return\n"
"== Breakpoints ==\n"
"  break|b|tbreak|tb ADDRESS    -- Set breakpoint\n"
"  info breakpoints|b           -- Show breakpoints\n"
"  ignore BREAKPOINT_ID COUNT   -- Ignore the breakpoint the next COUNT times\n"
"  delete [breakpoints] BREAKPOINT_ID [BREAKPOINT_ID...]               -- Delete the breakpoints\n"
"  disable [breakpoints] BREAKPOINT_ID [BREAKPOINT_ID...]              -- Disable the breakpoints\n"
"  enable [breakpoints] [once|delete] BREAKPOINT_ID [BREAKPOINT_ID...] -- Enable the breakpoints\n"
"\n=== Examining the state of the program ===\n"
"  info registers|r             -- CPU registers and condition codes\n"
"  x|dump|d START END           -- Examine the content of the memory\n"
"  x regs                       -- Examine the contents of registers\n"
"  disassemble|dasm [START [END]] -- Disassemble content of the memory\n"
"  history [COUNT]              -- Show the most recently executed instructions\n"
;

static volatile sig_atomic_t signal_received = 0;

static void sigproc(int sig)
{
  signal(SIGINT, sigproc); /* reset for portability */
  signal_received = 1;
}

void catch_interrupts()
{
  signal(SIGINT, sigproc);
}

bool take_interrupt()
{
  if (signal_received) {
    signal_received = 0;
    return true;
  }
  return false;
}

Debugger::Debugger(Machine &machine, bool quiet_mode, const char *exec_file) :
  machine(machine), quiet_mode(quiet_mode), exec_file(exec_file ? exec_file : "")
{
}

void Debugger::show_execution_position()
{
  Snapshot s = machine.snapshot();

  if (s.state != Running) {
    printf("0x%.4x:\t <%s>\n", s.pc, state_name(s.state));
    return;
  }
  printf("0x%.4x:[%.4x]\t %s\n", s.pc, s.ir,
	 s.decodable ? disassemble(s.next, s.pc).c_str() : "<reserved opcode>");
}

void Debugger::print_registers()
{
  Snapshot s = machine.snapshot();

  for (int i = 0; i < RegisterFile::COUNT; i++) {
    if (i == 4) printf("\n");
    printf("R%d:  %.4x (%6d)  ", i, s.registers[i], as_signed(s.registers[i]));
  }
  printf("\n");
  printf("PC:  %.4x (%6d)  NZP: %c%c%c  State: %s\n"
	 "Instructions Run: %lu\n",
	 s.pc, s.pc,
	 (s.flags & FL_NEG) ? '1' : '0',
	 (s.flags & FL_ZRO) ? '1' : '0',
	 (s.flags & FL_POS) ? '1' : '0',
	 state_name(s.state), s.instructions);
}

void Debugger::dump(uint16_t first, uint16_t last)
{
  uint16_t off = first;
  uint16_t counter = 1;

  std::ostringstream myout;
  myout << std::setw(4) << std::setfill('0') << std::hex << off << ":";
  for (;;) {
    myout << " " << std::hex << std::setw(4) << std::setfill('0')
	  << machine.peek(off);
    if (off == last) {
      break;
    }
    if (counter % 8 == 0) {
      myout << std::endl << std::hex << std::setw(4) << std::setfill('0')
	    << (uint16_t)(off + 1) << ":";
      counter = 0;
    }
    off++;
    counter++;
  }
  myout << std::endl;
  printf("%s", myout.str().c_str());
}

void Debugger::dasm(uint16_t first, uint16_t last)
{
  uint16_t pc = machine.snapshot().pc;

  for (uint16_t addr = first; ; addr++) {
    printf("%s0x%.4x:[%.4x]\t %s\n", addr == pc ? "=> " : "   ",
	   addr, machine.peek(addr), machine.disassemble(addr).c_str());
    if (addr == last) {
      break;
    }
  }
}

void Debugger::print_history(size_t count)
{
  if (op_history.empty()) {
    printf("No instructions executed yet.\n");
    return;
  }
  size_t start = op_history.size() > count ? op_history.size() - count : 0;
  for (size_t i = start; i < op_history.size(); i++) {
    printf("%s\n", op_history[i].c_str());
  }
}

void Debugger::resume(long count, int stop_at, bool stop_on_return)
{
  Snapshot s = machine.snapshot();
  if (s.state != Running) {
    fprintf(stderr, "The program is not running (%s). Use `run' to start it again.\n",
	    state_name(s.state));
    return;
  }

  bool first = true;	// don't stop again on the breakpoint we are standing on
  while (count != 0) {
    s = machine.snapshot();
    if (s.state != Running) {
      break;
    }
    if (take_interrupt()) {
      fprintf(stderr, "<Interrupted>\n");
      break;
    }
    if (!first) {
      if (stop_at == s.pc) {
	break;
      }
      if (stop_on_return && s.decodable &&
	  s.next.opcode == OP_JMP && s.next.jmp.base == 7) {
	fprintf(stderr, "stopped on return\n");
	break;
      }
      if (_breakpoints.check(s.pc)) {
	break;
      }
    }
    first = false;

    char entry[96];
    snprintf(entry, sizeof(entry), "0x%.4x:[%.4x]\t %s", s.pc, s.ir,
	     machine.disassemble(s.pc).c_str());
    op_history.push_back(entry);
    if (op_history.size() > HISTORY_SIZE) {
      op_history.pop_front();
    }

    try {
      machine.step();
    } catch (Error &e) {
      fflush(stdout);
      fprintf(stderr, "Program stopped: %s\n", e.what());
      break;
    }
    if (count > 0) {
      count--;
    }
  }

  fflush(stdout);
  s = machine.snapshot();
  if (s.state == Halted) {
    fprintf(stderr, "Program halted after %lu instructions.\n", s.instructions);
  }
  show_execution_position();
}

int Debugger::interact()
{
  if (!quiet_mode) {
    printf("Type `help' for a list of commands.\n");
    if (exec_file.empty()) {
      printf("Use 'load OBJECT_FILE' command to load the object for the simulation.\n");
    }
  }

  using_history();
  catch_interrupts();

  char *cmdline;
  while ((cmdline = readline(quiet_mode ? "(gdb) " : "(lc3vm) ")) != NULL) {
    if (*cmdline) {
      add_history(cmdline);
    }
    bool more = command(cmdline);
    free(cmdline);
    if (!more) {
      break;
    }
  }

  return 0;
}

bool Debugger::command(const std::string &cmdline)
{
  std::string cmd;
  std::string param1;
  std::string param2;
  int show_help = 0;

#define CMD_HELP(msg) \
      if (show_help) { \
          printf msg; \
          return true; \
      }

  if (cmdline.empty()) {
    cmd = last_cmd;
  } else {
    last_cmd = cmdline;
    cmd = cmdline;
  }

  std::istringstream incmd(cmd);
  std::string cmdstr;
  incmd >> cmdstr;

  if (cmdstr.empty()) {
    return true;
  }

  try {
    if (cmdstr == "help" || cmdstr == "h") {
      cmdstr.clear();
      incmd >> cmdstr;
      if (cmdstr.empty()) {
	// show general help with list of supported commands
	printf("%s", HELP_LIST);
	return true;
      } else {
	// display help for specific command
	show_help = 1;
      }
    }

    if (cmdstr == "quit" || cmdstr == "q" || cmdstr == "exit") {
      CMD_HELP(("Quits the debugging session.\n"));
      return false;
    } else if (cmdstr == "load" || cmdstr == "file") {
      CMD_HELP(
	  ("  load|file FILENAME.OBJ\n"
	   "Loads the object file and points PC at its origin. `run' reloads the last loaded file.\n"));
      incmd >> param1;
      if (param1.empty()) {
	fprintf(stderr, "Argument required (object file to load).\n");
	return true;
      }
      try {
	uint16_t origin = machine.load_file(param1);
	exec_file = param1;
	printf("Loaded %s at 0x%.4x\n", param1.c_str(), origin);
      } catch (Error &e) {
	fprintf(stderr, "%s\n", e.what());
      }
    } else if (cmdstr == "run" || cmdstr == "r") {
      CMD_HELP(
	  ("Reloads the object file given with `load' (or on the command line) and runs it\n"
	   "until it halts, faults or a breakpoint is hit.\n"));
      if (exec_file.empty()) {
	fprintf(stderr, "No object file loaded. Use `load FILENAME.OBJ'.\n");
	return true;
      }
      try {
	machine.load_file(exec_file);
      } catch (Error &e) {
	fprintf(stderr, "%s\n", e.what());
	return true;
      }
      op_history.clear();
      resume(-1);
    } else if (cmdstr == "continue" || cmdstr == "cont" || cmdstr == "c") {
      CMD_HELP(("Continue execution until the program halts, faults or a breakpoint is hit.\n"));
      resume(-1);
    } else if (cmdstr == "stepi" || cmdstr == "si" || cmdstr == "step" || cmdstr == "s") {
      CMD_HELP(
	  ("  stepi|si|step|s [COUNT]\n"
	   "Executes the next COUNT instructions (1 by default).\n"));
      incmd >> param1;
      int count = param1.empty() ? 1 : lexical_cast<int>(param1);
      resume(count);
    } else if (cmdstr == "nexti" || cmdstr == "ni" || cmdstr == "next" || cmdstr == "n") {
      CMD_HELP(
	  ("  nexti|ni|next|n\n"
	   "Executes the next instruction. A JSR/JSRR call is run until it returns.\n"));
      Snapshot s = machine.snapshot();
      if (s.decodable && s.next.opcode == OP_JSR) {
	resume(-1, (uint16_t)(s.pc + 1));
      } else {
	resume(1);
      }
    } else if (cmdstr == "finish") {
      CMD_HELP(("Continue until return (or until breakpoint is hit).\n"));
      resume(-1, -1, true);
    } else if (cmdstr == "break" || cmdstr == "b" || cmdstr == "tbreak" || cmdstr == "tb") {
      CMD_HELP(
	  ("  break|b|tbreak|tb ADDRESS\n"
	   "Sets a breakpoint at ADDRESS (PC when omitted). tbreak sets a temporary breakpoint\n"
	   "which is deleted when hit.\n"));
      incmd >> param1;
      uint16_t addr = param1.empty() ? machine.snapshot().pc : lexical_cast<uint16_t>(param1);
      _breakpoints.add(addr, cmdstr[0] == 't');
    } else if (cmdstr == "delete" || cmdstr == "disable" || cmdstr == "enable") {
      CMD_HELP(
	  ("  delete [breakpoints] BREAKPOINT_ID [BREAKPOINT_ID...]\n"
	   "  disable [breakpoints] BREAKPOINT_ID [BREAKPOINT_ID...]\n"
	   "  enable [breakpoints] [once|delete] BREAKPOINT_ID [BREAKPOINT_ID...]\n"
	   "Deletes, disables or enables breakpoints. `enable once' disables the breakpoint\n"
	   "after the next hit, `enable delete' deletes it.\n"));
      incmd >> param1;
      if (param1 == "breakpoints") {
	param1.clear();
	incmd >> param1;
      }
      BreakpointDisposition disp = Keep;
      if (cmdstr == "enable" && (param1 == "once" || param1 == "delete")) {
	disp = param1 == "once" ? Disable : Delete;
	param1.clear();
	incmd >> param1;
      }
      if (param1.empty()) {
	fprintf(stderr, "Argument required (breakpoint id).\n");
	return true;
      }
      do {
	int id = lexical_cast<int>(param1);
	if (cmdstr == "delete") {
	  _breakpoints.erase(id);
	} else if (cmdstr == "disable") {
	  _breakpoints.setEnabled(id, false, false, Keep);
	} else {
	  _breakpoints.setEnabled(id, true, disp != Keep, disp);
	}
	param1.clear();
	incmd >> param1;
      } while (!param1.empty());
    } else if (cmdstr == "ignore") {
      CMD_HELP(
	  ("  ignore BREAKPOINT_ID COUNT\n"
	   "Ignore the breakpoint the next COUNT times it is reached.\n"));
      incmd >> param1 >> param2;
      _breakpoints.setIgnoreCount(lexical_cast<int>(param1), lexical_cast<int>(param2));
    } else if (cmdstr == "dump" || cmdstr == "d" || cmdstr == "x") {
      incmd >> param1 >> param2;
      if (param1 == "regs") {
	CMD_HELP(("Shows content of the registers\n"));
	print_registers();
	return true;
      }
      CMD_HELP(("  x|dump|d FIRST_ADDR [LAST_ADDR]\n"
	    "Shows the content of the memory\n"));
      uint16_t first = lexical_cast<uint16_t>(param1);
      uint16_t last = param2.empty() ? first : lexical_cast<uint16_t>(param2);
      dump(first, last);
    } else if (cmdstr == "disassemble" || cmdstr == "dasm") {
      CMD_HELP(
	  ("  disassemble|dasm [START [END]]\n"
	   "Disassembles the memory from START to END (10 words from PC by default).\n"));
      incmd >> param1 >> param2;
      uint16_t first = param1.empty() ? machine.snapshot().pc : lexical_cast<uint16_t>(param1);
      uint16_t last = param2.empty() ? (uint16_t)(first + 9) : lexical_cast<uint16_t>(param2);
      dasm(first, last);
    } else if (cmdstr == "history") {
      CMD_HELP(
	  ("  history [COUNT]\n"
	   "Shows the last COUNT executed instructions (10 by default).\n"));
      incmd >> param1;
      print_history(param1.empty() ? 10 : lexical_cast<int>(param1));
    } else if (cmdstr == "info") {
      incmd >> param1;
      CMD_HELP(
          ("  info breakpoints|b        -- user settable breakpoints\n"
           "  info registers|r          -- CPU registers and condition codes\n"
           "Show various information about the state of the debugged program.\n"
          ));
      if (param1 == "breakpoints" || param1 == "b") {
	_breakpoints.showInfo();
      } else if (param1 == "registers" || param1 == "r") {
	print_registers();
      } else {
	printf("Undefined info command: \"%s\".  Try \"help info\".\n", param1.c_str());
      }
    } else {
      printf("Bad command `%s'\nTry using the `help' command.\n", cmd.c_str());
    }
  } catch (bad_lexical_cast &e) {
    printf("Bad command `%s'\nTry using the `help' command.\n", cmd.c_str());
  }

#undef CMD_HELP
  return true;
}

}

// vim: sw=2 si et:
