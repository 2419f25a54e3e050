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
\*/

#ifndef _LC3VM_HARDWARE_HPP
#define _LC3VM_HARDWARE_HPP

#include <stdio.h>
#include <termios.h>
#include "lc3vm/io.hpp"
#include "lc3vm/memory.hpp"

namespace LC3VM {

enum DeviceAddress
{
  KBSR_ADDRESS = 0xFE00, // keyboard status, bit 15 set when a key is ready
  KBDR_ADDRESS = 0xFE02  // keyboard data, reading it acknowledges the key
};

/*
 * Memory mapped devices of one machine. Registers the keyboard
 * status/data words on the memory it is constructed with.
 */
class Hardware
{
public:
  Hardware(Memory &mem, InputSource &input);
  ~Hardware();

  // Latch a key as if it had just been typed.
  void key_event(uint8_t key);
  bool key_ready() const;

private:
  Hardware(const Hardware &);
  Hardware &operator=(const Hardware &);

  class Implementation;
  Implementation *impl;
};

// Input from a file descriptor, normally the terminal.
class FdInput : public InputSource
{
public:
  FdInput(int fd) : fd(fd) { }

  bool available();
  int read_one_byte();

private:
  int fd;
};

class FileOutput : public OutputSink
{
public:
  FileOutput(FILE *file) : file(file) { }

  void put(uint8_t byte);
  void flush();

private:
  FILE *file;
};

// Puts a terminal into non-canonical, no-echo mode for its lifetime.
// Does nothing when fd is not a tty.
class TerminalMode
{
public:
  TerminalMode(int fd);
  ~TerminalMode();

  void restore();

private:
  TerminalMode(const TerminalMode &);
  TerminalMode &operator=(const TerminalMode &);

  int fd;
  bool active;
  struct termios termios_original;
};

}

#endif
