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

#include <unistd.h>
#include "lc3vm/terminal.hpp"

namespace LC3VM {

Terminal::Terminal(int _fd)
  : fd(-1)
{
  if (!isatty(_fd) || tcgetattr(_fd, &termios_original) == -1) {
    return;
  }
  struct termios new_termios = termios_original;
  new_termios.c_lflag &= ~(ICANON | ECHO);
  if (tcsetattr(_fd, TCSANOW, &new_termios) == 0) {
    fd = _fd;
  }
}

Terminal::~Terminal()
{
  if (fd != -1) {
    // restore previous settings
    tcsetattr(fd, TCSANOW, &termios_original);
  }
}

}
