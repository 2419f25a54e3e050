/*\
 *  This file is part of LC-3 VM.
 *  Copyright (C) 2010  Edgar Lakis <edgar.lakis@gmail.com>
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

#ifndef _LC3VM_BREAKPOINTS_HPP
#define _LC3VM_BREAKPOINTS_HPP

#include <list>
#include <set>
#include <stdint.h>

namespace LC3VM {

enum BreakpointDisposition
{
  Keep,
  Disable,
  Delete
};

struct Breakpoint
{
  int id;
  uint16_t address;
  BreakpointDisposition disposition;
  bool enabled;
  int ignore_count;
  int hits;

  Breakpoint(int _id, uint16_t _address) :
    id(_id), address(_address),
    disposition(Keep), enabled(true), ignore_count(0), hits(0) {}
};

typedef std::list<Breakpoint>::iterator BreakpointIterator;

/*
 * Usage:
 * * Create new Breakpoint (by address)
 * * Delete breakpoint
 * * Enable/Disable Breakpoint
 * * Set ignore count	(on hit action)
 * * Enable once/delete  (on hit action)
 * * Hit: Check for active breakpoint at address
 *
 * Methods taking an id return the id, or -1 (after telling the user)
 * if there is no such breakpoint.
 */
class UserBreakpoints {
public:
  UserBreakpoints() : last_id(0) {}

  int add(uint16_t address, bool temp);
  int erase(int id);
  int setEnabled(int id, bool enable, bool setDisp, BreakpointDisposition disp);
  int setIgnoreCount(int id, int count);
  // Id of the breakpoint stopping execution at address, 0 if none.
  int check(uint16_t address);
  void showInfo();

  size_t size() const { return breakpoints.size(); }
  const Breakpoint *find(int id);

private:
  int last_id; 
  // Active breakpoints for quick check before each execution cycle
  // Note that we don't support multiple breakpoints for same location (even though gdb does it).
  std::set<uint16_t> active_breakpoints;
  std::list<Breakpoint> breakpoints; // Full information about user breakpoints
  BreakpointIterator lookupA(uint16_t address);
  BreakpointIterator lookupI(int id);
  int erase(BreakpointIterator it);
  int setEnabled(BreakpointIterator it, bool enable, bool setDisp, BreakpointDisposition disp);
};

}

#endif
