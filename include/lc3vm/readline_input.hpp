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

#ifndef _LC3VM_READLINE_INPUT_HPP
#define _LC3VM_READLINE_INPUT_HPP

#include <string>
#include "lc3vm/channel.hpp"

namespace LC3VM {

// Line edited program input. A whole line is read with readline(), then
// handed out byte by byte followed by a newline. ready() reads the next line
// once input is pending on rl_instream, so keyboard polls see it.
class ReadlineInput : public InputChannel
{
public:
  explicit ReadlineInput(const char *prompt = "");

  int get();
  bool ready();

private:
  bool next_line();

  std::string prompt;
  std::string line;
  size_t pos;
  bool eof;
};

}

#endif
