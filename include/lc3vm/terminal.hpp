/*\
 *  LC-3 Simulator
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

#ifndef _LC3VM_TERMINAL_HPP
#define _LC3VM_TERMINAL_HPP

#include <termios.h>

namespace LC3VM {

// Puts a tty into non-canonical, non-echo mode for the lifetime of the
// object. Does nothing when fd is not a terminal.
class Terminal
{
public:
  explicit Terminal(int fd);
  ~Terminal();

  bool active() const { return fd != -1; }

private:
  Terminal(const Terminal &);
  Terminal &operator=(const Terminal &);

  int fd;
  struct termios termios_original;
};

}

#endif
