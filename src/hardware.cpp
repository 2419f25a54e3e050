/*\
 *  LC-3 VM
 *  Copyright (C) 2004  Anthony Liguori <aliguori@cs.utexas.edu>
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
#include <errno.h>
#include <termios.h>
#include <sys/types.h>
#include <sys/time.h>
#include <sys/select.h>
#include <unistd.h>
#include "lc3vm/hardware.hpp"

namespace LC3VM {

static int data_available (int fd)
{
  struct timeval tv;
  fd_set rdfs;

  tv.tv_sec = 0;
  tv.tv_usec = 0;

  FD_ZERO(&rdfs);
  FD_SET (fd, &rdfs);

  if (select(fd+1, &rdfs, NULL, NULL, &tv) <= 0) {
    return 0;
  }
  return FD_ISSET(fd, &rdfs);
}

// Shared by the status and data registers.
struct KeyboardLatch
{
  KeyboardLatch(InputSource &input) : input(input), ready(false), data(0) { }

  InputSource &input;
  bool ready;
  uint16_t data;
};

struct KBSR : public MappedWord
{
  KBSR(KeyboardLatch &kb) : kb(kb) { }

  uint16_t read() {
    if (!kb.ready && kb.input.available()) {
      int c = kb.input.read_one_byte();
      if (c >= 0) {
	kb.data = (uint16_t)c;
	kb.ready = true;
      }
    }
    return peek();
  }
  uint16_t peek() const { return kb.ready ? 0x8000 : 0; }

private:
  KeyboardLatch &kb;
};

struct KBDR : public MappedWord
{
  KBDR(KeyboardLatch &kb) : kb(kb) { }

  uint16_t read() {
    kb.ready = false;
    return kb.data;
  }
  uint16_t peek() const { return kb.data; }

private:
  KeyboardLatch &kb;
};

class Hardware::Implementation
{
public:
  Implementation(Memory &mem, InputSource &input) :
    kb(input), kbsr(kb), kbdr(kb)
  {
    mem.register_dma(KBSR_ADDRESS, &kbsr);
    mem.register_dma(KBDR_ADDRESS, &kbdr);
  }

  KeyboardLatch kb;
  KBSR kbsr;
  KBDR kbdr;
};

Hardware::Hardware(Memory &mem, InputSource &input) :
  impl(new Implementation(mem, input))
{
}

Hardware::~Hardware()
{
  delete impl;
}

void Hardware::key_event(uint8_t key)
{
  impl->kb.data = key;
  impl->kb.ready = true;
}

bool Hardware::key_ready() const
{
  return impl->kb.ready;
}

bool FdInput::available()
{
  return data_available(fd);
}

int FdInput::read_one_byte()
{
  unsigned char c;
  for (;;) {
    ssize_t ret = read(fd, &c, 1);
    if (ret == 1) {
      return c;
    }
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return -1;
  }
}

void FileOutput::put(uint8_t byte)
{
  putc(byte, file);
}

void FileOutput::flush()
{
  fflush(file);
}

TerminalMode::TerminalMode(int fd) : fd(fd), active(false)
{
  struct termios new_termios;

  if (!isatty(fd) || tcgetattr(fd, &new_termios) == -1) {
    return;
  }
  termios_original = new_termios;
  new_termios.c_lflag &= ~(ICANON | ECHO);
  new_termios.c_cc[VMIN] = 1;
  new_termios.c_cc[VTIME] = 0;
  if (tcsetattr(fd, TCSANOW, &new_termios) == 0) {
    active = true;
  } else {
    perror("tcsetattr");
  }
}

TerminalMode::~TerminalMode()
{
  restore();
}

void TerminalMode::restore()
{
  if (active) {
    // restore previous settings
    tcsetattr(fd, TCSANOW, &termios_original);
    active = false;
  }
}

}
