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
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <stdio.h>
#include "lc3vm/loader.hpp"
#include "lc3vm/errors.hpp"

namespace LC3VM {

static uint16_t word_at(const uint8_t *image, size_t index)
{
  return (image[2 * index] << 8) | image[2 * index + 1];
}

uint16_t load_image(Memory &mem, const uint8_t *image, size_t size)
{
  char buf[96];

  if (size == 0) {
    throw LoadError("empty object image");
  }
  if (size % 2) {
    snprintf(buf, sizeof(buf),
             "object image must hold whole 16 bit words, got %lu bytes",
             (unsigned long)size);
    throw LoadError(buf);
  }

  uint16_t origin = word_at(image, 0);
  size_t words = size / 2 - 1;
  if (origin + words > Memory::SIZE) {
    snprintf(buf, sizeof(buf),
             "object image of %lu words does not fit at origin x%.4x",
             (unsigned long)words, origin);
    throw LoadError(buf);
  }

  for (size_t i = 0; i < words; i++) {
    mem[origin + i] = word_at(image, i + 1);
  }
  return origin;
}

Machine load(const std::vector<uint8_t> &image)
{
  Machine machine;
  machine.regs.PC = load_image(machine.mem, image.empty() ? NULL : &image[0],
                               image.size());
  return machine;
}

static std::string errno_message(const std::string &filename)
{
  return filename + ": " + strerror(errno);
}

std::vector<uint8_t> read_object_file(const std::string &filename)
{
  int fd = open(filename.c_str(), O_RDONLY);
  struct stat stats;

  if (fd == -1) {
    throw LoadError(errno_message(filename));
  }
  if (fstat(fd, &stats) == -1) {
    std::string message = errno_message(filename);
    close(fd);
    throw LoadError(message);
  }

  std::vector<uint8_t> image(stats.st_size);
  size_t done = 0;
  while (done < image.size()) {
    ssize_t ret = ::read(fd, &image[done], image.size() - done);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      std::string message = ret == 0 ? filename + ": unexpected end of file"
                                     : errno_message(filename);
      close(fd);
      throw LoadError(message);
    }
    done += ret;
  }
  close(fd);

  return image;
}

}

// vim: sw=2 si:
