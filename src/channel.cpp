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

#include <sys/types.h>
#include <sys/time.h>
#include <sys/select.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <stdio.h>
#include "lc3vm/channel.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

InputChannel::~InputChannel() { }

OutputChannel::~OutputChannel() { }

void OutputChannel::write(const char *s)
{
  while (*s) {
    put(*s++);
  }
}

bool data_available(int fd)
{
  struct timeval tv;
  fd_set rdfs;

  tv.tv_sec = 0;
  tv.tv_usec = 0;

  FD_ZERO(&rdfs);
  FD_SET(fd, &rdfs);

  if (select(fd + 1, &rdfs, NULL, NULL, &tv) <= 0) {
    return false;
  }
  return FD_ISSET(fd, &rdfs);
}

int FdInput::get()
{
  unsigned char c;
  ssize_t ret = ::read(fd, &c, 1);
  // EINTR counts as end of input so that a SIGINT can stop a program
  // blocked in GETC.
  if (ret != 1) {
    return END_OF_INPUT;
  }
  return c;
}

bool FdInput::ready()
{
  return data_available(fd);
}

FdOutput::~FdOutput()
{
  if (pending.empty()) {
    return;
  }
  try {
    flush();
  } catch (IoError &e) {
    fprintf(stderr, "%s\n", e.what());
  }
}

void FdOutput::put(uint8_t c)
{
  pending += (char)c;
  if (c == '\n') {
    flush();
  }
}

void FdOutput::flush()
{
  size_t done = 0;
  while (done < pending.size()) {
    ssize_t ret = ::write(fd, pending.data() + done, pending.size() - done);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      pending.clear();
      throw IoError(std::string("write to output failed: ") + strerror(errno));
    }
    done += ret;
  }
  pending.clear();
}

}
