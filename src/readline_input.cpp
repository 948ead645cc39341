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

#include <stdio.h>
#include <stdlib.h>
#include <readline/readline.h>
#include <readline/history.h>
#include "lc3vm/readline_input.hpp"

namespace LC3VM {

ReadlineInput::ReadlineInput(const char *prompt)
  : prompt(prompt), pos(0), eof(false)
{
  using_history();
}

// Returns false once readline() reports end of file.
bool ReadlineInput::next_line()
{
  char *cmdline = readline(prompt.c_str());
  if (!cmdline) {
    eof = true;
    return false;
  }
  if (*cmdline) {
    add_history(cmdline);
  }
  line.assign(cmdline);
  line += '\n';
  pos = 0;
  free(cmdline);
  return true;
}

int ReadlineInput::get()
{
  if (pos >= line.size() && (eof || !next_line())) {
    return END_OF_INPUT;
  }
  return (unsigned char)line[pos++];
}

bool ReadlineInput::ready()
{
  if (pos < line.size()) {
    return true;
  }
  if (eof || !data_available(fileno(rl_instream ? rl_instream : stdin))) {
    return false;
  }
  return next_line();
}

}
