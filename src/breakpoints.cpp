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

#include <stdio.h>
#include "lc3vm/breakpoints.hpp"

namespace LC3VM {

//////////////////////////////////////////////////////////
// User interface messages related to breakpoint commands
class BreakpointsUI {
public:
  // New:
  //   Breakpoint 8 at 0x3004.
  //   Temporary breakpoint 8 at 0x3004.
  static void creation(int id, uint16_t address, bool temporary) {
    printf("%s %d at 0x%04x.\n",
	   temporary ? "Temporary breakpoint" : "Breakpoint",
	   id, address);
  }

  // Hit:
  //   Breakpoint 7, 0x3004.
  static void hit(int id, uint16_t address, bool temporary) {
    printf("%s %d, 0x%04x.\n",
	   temporary ? "Temporary breakpoint" : "Breakpoint",
	   id, address);
  }

  // List:
  //	Num     Type           Disp Enb Address
  //	1       breakpoint     dis  n   0x3004
  //	 	breakpoint already hit 2 times
  //	 	ignore next 2 hits
  static void list_header(bool not_empty){
    if (not_empty) {
      printf("%-8s%-15s%-5s%-4s%s\n",
	  "Num", "Type", "Disp", "Enb", "Address");
    } else {
      printf("No breakpoints.\n");
    }
  }
  static void list_line(const Breakpoint &b){
    const char * dispStr = "keep";
    if (b.disposition == Delete) {
      dispStr = "del";
    } else if (b.disposition == Disable) {
      dispStr = "dis";
    }

    printf("%-8d%-15s%-5s%-4s0x%.4x\n",
	   b.id, "breakpoint", dispStr, b.enabled ? "y" : "n", b.address);
    if (b.hits) printf("\t	breakpoint already hit %d times\n", b.hits);
    if (b.ignore_count) printf("\t	ignore next %d hits\n", b.ignore_count);
  }

  static void ignore_success(int id, int count){
    printf("Will ignore next %d crossings of breakpoint %d.\n", count, id);
  }
  static void no_breakpoint(int id){
    printf("No breakpoint number %d.\n", id);
  }
  // Duplicates not allowed
  static void duplicate(uint16_t address, int id){
    printf("Breakpoint for address 0x%04x already defined, see breakpoint %d.\n", address, id);
  }
};


//////////////////////////////////////////////////////////
// UserBreakpoints class
int UserBreakpoints::add(uint16_t address, bool temp)
{ 
  BreakpointIterator it = lookupA(address);
  if (it != breakpoints.end()) {
    BreakpointsUI::duplicate(address, it->id);
    return -1;
  }

  Breakpoint b(++last_id, address);
  if (temp) {
    b.disposition = Delete;
  }
  breakpoints.push_back(b);
  active_breakpoints.insert(address);
  BreakpointsUI::creation(last_id, address, temp);

  return last_id;
}

int UserBreakpoints::erase(BreakpointIterator it)
{
  int id = it->id;
  active_breakpoints.erase(it->address);
  breakpoints.erase(it);

  return id;
}

int UserBreakpoints::erase(int id)
{
  BreakpointIterator it = lookupI(id);
  if (it == breakpoints.end()) {
    BreakpointsUI::no_breakpoint(id);
    return -1;
  }

  return erase(it);
}

int UserBreakpoints::setEnabled(BreakpointIterator it, bool enable, bool setDisp, BreakpointDisposition disp)
{
  if (enable) {
    active_breakpoints.insert(it->address);
  } else {
    active_breakpoints.erase(it->address);
  }
  it->enabled = enable;

  if (setDisp)
    it->disposition = disp;

  return it->id;
}

int UserBreakpoints::setEnabled(int id, bool enable, bool setDisp, BreakpointDisposition disp)
{
  BreakpointIterator it = lookupI(id);
  if (it == breakpoints.end()) {
    BreakpointsUI::no_breakpoint(id);
    return -1;
  }

  return setEnabled(it, enable, setDisp, disp);
}

int UserBreakpoints::setIgnoreCount(int id, int count)
{
  BreakpointIterator it = lookupI(id);
  if (it == breakpoints.end()) {
    BreakpointsUI::no_breakpoint(id);
    return -1;
  }

  it->ignore_count = count;
  BreakpointsUI::ignore_success(id, count);

  return id;
}

int UserBreakpoints::check(uint16_t address)
{
  // This must be efficient (used each cycle).
  // First make a quick check
  if (!active_breakpoints.count(address)) {
    return 0;
  }

  // Only single breakpoint per address, so the first match is the one
  BreakpointIterator it = lookupA(address);
  if (it == breakpoints.end() || !it->enabled) {
    return 0;
  }

  it->hits++;
  if (it->ignore_count) {
    it->ignore_count--;
    return 0;
  }

  int id = it->id;
  bool temporary = false;
  switch (it->disposition) { 
  case Keep:
    break;
  case Disable:
    setEnabled(it, false, true, Disable);
    break;
  case Delete:
    temporary = true;
    break;
  }
  BreakpointsUI::hit(id, address, temporary);
  if (temporary) 
    erase(it);

  return id;
}

void UserBreakpoints::showInfo()
{
  BreakpointsUI::list_header(!breakpoints.empty());

  for (BreakpointIterator it = breakpoints.begin();
      it != breakpoints.end();
      it++) {
    BreakpointsUI::list_line(*it);
  }
}

const Breakpoint *UserBreakpoints::find(int id)
{
  BreakpointIterator it = lookupI(id);
  return it == breakpoints.end() ? NULL : &*it;
}

BreakpointIterator UserBreakpoints::lookupA(uint16_t address)
{
    BreakpointIterator it;

    for (it = breakpoints.begin();
	 it != breakpoints.end();
	 it++) {
      if (it->address == address) {
	return it;
      }
    }
    
    return breakpoints.end();
}

BreakpointIterator UserBreakpoints::lookupI(int id)
{
    BreakpointIterator it;

    for (it = breakpoints.begin();
	 it != breakpoints.end();
	 it++) {
      if (it->id == id) {
	return it;
      }
    }
    
    return breakpoints.end();
}

}

// vim: sw=2 si:
