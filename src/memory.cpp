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

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include "lc3vm/memory.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

MappedWord::~MappedWord() { }

Memory::Memory()
{
  mem = new uint16_t[SIZE];
  for (int i=0; i < SIZE; i++) {
    mem[i] = 0;
  }
}

Memory::~Memory()
{
  delete [] mem;
}

MappedWord *Memory::mapped_word(uint16_t index) const
{
  dma_map_t::const_iterator i = dma.find(index);
  if (i != dma.end()) {
    return i->second;
  }
  return 0;
}

uint16_t Memory::read(uint16_t address)
{
  MappedWord *mapped = mapped_word(address);
  if (mapped) {
    return mapped->read();
  }
  return mem[address];
}

uint16_t Memory::peek(uint16_t address) const
{
  MappedWord *mapped = mapped_word(address);
  if (mapped) {
    return mapped->peek();
  }
  return mem[address];
}

void Memory::write(uint16_t address, uint16_t value)
{
  mem[address] = value;
}

void Memory::load(uint16_t origin, const std::vector<uint16_t> &words)
{
  if (origin + words.size() > (size_t)SIZE) {
    char buf[80];
    snprintf(buf, sizeof(buf), "%lu words do not fit in memory",
	     (unsigned long)words.size());
    throw Error(ImageLoadOverflow, origin, buf);
  }
  for (size_t i = 0; i < words.size(); i++) {
    mem[origin + i] = words[i];
  }
}

uint16_t Memory::load_image(const std::vector<uint8_t> &bytes)
{
  if (bytes.size() < 2) {
    throw Error(ImageUnreadable, 0, "image is missing the origin word");
  }
  uint16_t origin = (bytes[0] << 8) | bytes[1];
  std::vector<uint16_t> words;
  words.reserve((bytes.size() - 2) / 2);
  // a trailing odd byte is not a word and is dropped
  for (size_t i = 2; i + 1 < bytes.size(); i += 2) {
    words.push_back((bytes[i] << 8) | bytes[i+1]);
  }
  load(origin, words);

  return origin;
}

uint16_t Memory::load_file(const std::string &filename)
{
  int fd = open(filename.c_str(), O_RDONLY);
  struct stat stats;

  if (fd == -1) {
    throw Error(ImageUnreadable, 0, filename + ": " + strerror(errno));
  }
  if (fstat(fd, &stats) == -1) {
    int err = errno;
    close(fd);
    throw Error(ImageUnreadable, 0, filename + ": " + strerror(err));
  }

  std::vector<uint8_t> bytes(stats.st_size);
  size_t done = 0;
  while (done < bytes.size()) {
    ssize_t ret = ::read(fd, &bytes[done], bytes.size() - done);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      int err = ret ? errno : EIO;
      close(fd);
      throw Error(ImageUnreadable, 0, filename + ": " + strerror(err));
    }
    done += ret;
  }
  close(fd);

  return load_image(bytes);
}

void Memory::register_dma(uint16_t address, MappedWord *word)
{
  dma[address] = word;
}

}

// vim: sw=2 si:
