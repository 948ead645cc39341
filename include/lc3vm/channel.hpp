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

#ifndef _LC3VM_CHANNEL_HPP
#define _LC3VM_CHANNEL_HPP

#include <string>
#include <stdint.h>

namespace LC3VM {

enum { END_OF_INPUT = -1 };

// True when a read() on fd would not block.
bool data_available(int fd);

class InputChannel
{
public:
  virtual ~InputChannel();

  // Blocks until a byte is available. Returns END_OF_INPUT once the
  // source is closed.
  virtual int get() = 0;

  // True when get() would not block.
  virtual bool ready() = 0;
};

class OutputChannel
{
public:
  virtual ~OutputChannel();

  virtual void put(uint8_t c) = 0;
  virtual void flush() { }

  void write(const char *s);
};

class FdInput : public InputChannel
{
public:
  explicit FdInput(int fd) : fd(fd) { }

  int get();
  bool ready();

private:
  int fd;
};

class FdOutput : public OutputChannel
{
public:
  explicit FdOutput(int fd) : fd(fd) { }
  ~FdOutput();

  void put(uint8_t c);
  void flush();

private:
  int fd;
  std::string pending;
};

}

#endif
