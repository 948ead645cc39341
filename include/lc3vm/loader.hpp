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

#ifndef _LC3VM_LOADER_HPP
#define _LC3VM_LOADER_HPP

#include <string>
#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "lc3vm/machine.hpp"

namespace LC3VM {

/*
 * Object image layout, big-endian 16 bit words:
 *
 *   word 0      origin
 *   word 1..N   contents of origin .. origin+N-1
 *
 * All loaders throw LoadError and write nothing when the image is empty,
 * has an odd byte count or does not fit between the origin and xFFFF.
 */

// Copies the image into `mem' and returns its origin.
uint16_t load_image(Memory &mem, const uint8_t *image, size_t size);

// A fresh machine holding the image, with PC at the origin.
Machine load(const std::vector<uint8_t> &image);

std::vector<uint8_t> read_object_file(const std::string &filename);

}

#endif
