/*\
 *  LC-3 VM
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
 *  Modifications 2010  Edgar Lakis <edgar.lakis@gmail.com>
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
 *
 * vim: sw=2 si:
\*/

#include <stdio.h>
#include <unistd.h>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>

#include "lc3vm/debugger.hpp"
#include "lc3vm/errors.hpp"
#include "lc3vm/hardware.hpp"
#include "lc3vm/machine.hpp"

using namespace LC3VM;

const char * PROGRAM = "LC-3 VM 1.0";
const char * INFO =
"LC-3 VM is free software, covered by the GNU General Public\n"
"License, and you are welcome to change it and/or distribute copies of it\n"
"under certain conditions.\n"
"There is absolutely no warranty for LC-3 VM.";

static void usage(const char *argv0)
{
  printf("Usage: %s [OPTIONS] IMAGE.obj\n"
	 "Runs an LC-3 program image, or debugs it interactively.\n"
	 "\n"
	 "  -d, --debug              start the interactive debugger\n"
	 "  -q, --quiet              no banner or informational messages\n"
	 "  -t, --trace=FILE         log every executed instruction to FILE\n"
	 "  -h, --help               displays this help screen\n"
	 "  -V, --version            displays the version\n"
	 "\n"
	 "The LC3VM_TRACE environment variable gives a default trace file.\n"
	 , argv0);
}

// Runs the program to completion with the terminal in raw mode.
static int run_mode(Machine &machine, bool quiet_mode)
{
  TerminalMode tty(fileno(stdin));
  catch_interrupts();

  try {
    while (machine.state() == Running) {
      if (take_interrupt()) {
	fflush(stdout);
	fprintf(stderr, "\n<Interrupted> at 0x%.4x\n", machine.snapshot().pc);
	return 2;
      }
      machine.step();
    }
  } catch (Error &e) {
    fflush(stdout);
    tty.restore();
    fprintf(stderr, "\n%s\n", e.what());
    return 1;
  }

  fflush(stdout);
  if (!quiet_mode) {
    fprintf(stderr, "\n--- halting the LC-3 ---\n");
  }
  return 0;
}

int main(int argc, char **argv) 
{
  struct option longopts[] = {
    {"debug"   , 0, 0, 'd'},
    {"quiet"   , 0, 0, 'q'},
    {"trace"   , 1, 0, 't'},
    {"help"    , 0, 0, 'h'},
    {"version" , 0, 0, 'V'},
    {NULL      , 0, 0, 0}
  };
  int ch;
  int index = 0;
  bool debug_mode = false;
  bool quiet_mode = false;
  const char *trace_file = getenv("LC3VM_TRACE");

  while (-1 != (ch = getopt_long(argc, argv, "dqt:hV", longopts, &index))) {
    switch (ch) {
    case 'd':
      debug_mode = true;
      break;
    case 'q':
      quiet_mode = true;
      break;
    case 't':
      trace_file = optarg;
      break;
    case 'h':
      usage(*argv);
      exit(0);
      break;
    case 'V':
      printf("%s\n", PROGRAM);
      exit(0);
      break;
    default:
      usage(*argv);
      exit(2);
    }
  }

  const char *exec_file = NULL;
  if (optind < argc) {
    exec_file = argv[optind];
  } else if (!debug_mode) {
    usage(*argv);
    exit(2);
  }

  FdInput input(fileno(stdin));
  FileOutput output(stdout);
  Machine machine(input, output);

  FILE *traceout = NULL;
  if (trace_file && *trace_file) {
    traceout = fopen(trace_file, "w");
    if (!traceout) {
      perror(trace_file);
      exit(1);
    }
    machine.set_trace(traceout);
  }

  if (exec_file) {
    try {
      uint16_t origin = machine.load_file(exec_file);
      if (!quiet_mode) {
	fprintf(stderr, "Loaded %s at 0x%.4x\n", exec_file, origin);
      }
    } catch (Error &e) {
      fprintf(stderr, "failed to load %s: %s\n", exec_file, e.what());
      exit(1);
    }
  }

  int ret;
  if (debug_mode) {
    if (!quiet_mode) {
      printf("%s\n%s\n", PROGRAM, INFO);
    }
    Debugger debugger(machine, quiet_mode, exec_file);
    ret = debugger.interact();
  } else {
    ret = run_mode(machine, quiet_mode);
  }

  if (traceout) {
    fclose(traceout);
  }
  return ret;
}
