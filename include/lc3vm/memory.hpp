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

#ifndef _LC3VM_MEMORY_HPP
#define _LC3VM_MEMORY_HPP

#include <string>
#include <vector>
#include <map>
#include <stdint.h>

namespace LC3VM {

struct MappedWord;

/*
 * The 64K word address space. Every 16-bit address is valid.
 * Reads of addresses with a registered device are served by the device;
 * writes always go to plain storage.
 */
class Memory {
public:
  enum { SIZE = 0x10000 };

  Memory();
  ~Memory();

  uint16_t read(uint16_t address);
  // Same as read() but never triggers device side effects.
  uint16_t peek(uint16_t address) const;
  void write(uint16_t address, uint16_t value);

  // Throws ImageLoadOverflow (leaving memory untouched) if the words
  // do not fit between origin and the end of the address space.
  void load(uint16_t origin, const std::vector<uint16_t> &words);
  // Big-endian origin word followed by big-endian body words.
  uint16_t load_image(const std::vector<uint8_t> &bytes);
  uint16_t load_file(const std::string &filename);

  void register_dma(uint16_t address, MappedWord *word);

private:
  Memory(const Memory &);
  Memory &operator=(const Memory &);

  MappedWord *mapped_word(uint16_t index) const;
  typedef std::map<uint16_t, MappedWord *> dma_map_t;
  dma_map_t dma;

  uint16_t *mem;
};

struct MappedWord
{
  virtual ~MappedWord() = 0;
  // Read issued by the program; may acknowledge the device.
  virtual uint16_t read() { return peek(); }
  virtual uint16_t peek() const { return 0; }
};

}

#endif
