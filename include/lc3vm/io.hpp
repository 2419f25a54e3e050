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

#ifndef _LC3VM_IO_HPP
#define _LC3VM_IO_HPP

#include <string>
#include <stdint.h>

namespace LC3VM {

// Where the keyboard device and the input traps get their characters.
class InputSource
{
public:
  virtual ~InputSource() { }
  // True if read_one_byte() would return without blocking.
  virtual bool available() = 0;
  // Blocks until a byte arrives. Returns -1 at end of input.
  virtual int read_one_byte() = 0;
};

// Receives the bytes written by the output traps, in program order.
class OutputSink
{
public:
  virtual ~OutputSink() { }
  virtual void put(uint8_t byte) = 0;
  virtual void flush() { }

  void write(const char *str);
};

// Finite in-memory input. Never blocks: end of the buffer is end of input.
class BufferInput : public InputSource
{
public:
  BufferInput(const std::string &data = "") : data(data), pos(0) { }

  bool available() { return pos < data.size(); }
  int read_one_byte();
  void append(const std::string &more) { data += more; }

private:
  std::string data;
  size_t pos;
};

class BufferOutput : public OutputSink
{
public:
  BufferOutput() : flushes(0) { }

  void put(uint8_t byte) { data += (char)byte; }
  void flush() { flushes++; }

  const std::string &str() const { return data; }
  int flush_count() const { return flushes; }
  void clear() { data.clear(); }

private:
  std::string data;
  int flushes;
};

}

#endif
