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
 *
 * vim: sw=2 si:
\*/

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <getopt.h>
#include <signal.h>
#include <string>
#include <vector>

#include "lc3vm/machine.hpp"
#include "lc3vm/cpu.hpp"
#include "lc3vm/loader.hpp"
#include "lc3vm/channel.hpp"
#include "lc3vm/readline_input.hpp"
#include "lc3vm/terminal.hpp"
#include "lc3vm/keyboard.hpp"
#include "lc3vm/trace.hpp"
#include "lc3vm/disassembler.hpp"
#include "lc3vm/lexical_cast.hpp"
#include "lc3vm/errors.hpp"

using namespace LC3VM;

const char * PROGRAM = "LC-3 VM 1.0";
const char * COPYRIGHT =
"Copyright 2004 Anthony Liguori <aliguori@cs.utexas.edu>";
const char * INFO =
"lc3vm is free software, covered by the GNU General Public License, and\n"
"you are welcome to change it and/or distribute copies of it under\n"
"certain conditions.\n"
"There is absolutely no warranty for lc3vm.";

enum ExitStatus
{
  EXIT_HALTED = 0,
  EXIT_USAGE = 1,
  EXIT_ILLEGAL = 2,
  EXIT_INTERRUPTED = 130
};

static volatile sig_atomic_t signal_received = 0;

static void sigproc(int sig)
{
  signal_received = 1;
}

// No SA_RESTART: a read() blocked in GETC must return so the run loop can
// notice the interrupt.
static void install_sigint()
{
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = sigproc;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, NULL);
}

static void usage(const char *argv0)
{
  printf("Usage: %s [OPTION]... FILE.obj [FILE.obj]...\n"
         "Runs LC-3 object images until they halt.\n"
         "\n"
         "  -e, --entry=ADDR         start at ADDR (x3000, 0x3000 or decimal)\n"
         "                           instead of the origin of the first image\n"
         "  -t, --trace=FILE         write an execution trace to FILE\n"
         "  -l, --line-edit          read program input line by line with\n"
         "                           editing and history\n"
         "  -d, --disassemble        list the loaded images and exit\n"
         "  -q, --quiet              only print program output\n"
         "  -h, --help               displays this help screen\n"
         "  -V, --version            displays version information\n"
         "\n"
         "Images are loaded in the order given; later images overwrite\n"
         "earlier ones where they overlap.\n"
         , argv0);
}

struct Image
{
  std::string filename;
  uint16_t origin;
  size_t words;
};

static void disassemble_image(const Machine &machine, const Image &image)
{
  printf("; %s\n", image.filename.c_str());
  for (size_t i = 0; i < image.words; i++) {
    uint16_t address = image.origin + i;
    uint16_t IR = machine.mem[address];
    printf("0x%.4x: %.4x: %s\n", address, IR, disassemble(IR, address).c_str());
  }
}

int main(int argc, char **argv)
{
  struct option longopts[] = {
    {"entry"      , 1, 0, 'e'},
    {"trace"      , 1, 0, 't'},
    {"line-edit"  , 0, 0, 'l'},
    {"disassemble", 0, 0, 'd'},
    {"quiet"      , 0, 0, 'q'},
    {"help"       , 0, 0, 'h'},
    {"version"    , 0, 0, 'V'},
    {NULL         , 0, 0, 0}
  };
  int ch;
  int index = 0;
  bool quiet_mode = false;
  bool line_edit = false;
  bool listing = false;
  bool have_entry = false;
  uint16_t entry = 0;
  const char *trace_file = NULL;

  while (-1 != (ch = getopt_long(argc, argv, "e:t:ldqhV", longopts, &index))) {
    switch (ch) {
    case 'e':
      try {
        entry = lexical_cast<uint16_t>(optarg);
        have_entry = true;
      } catch (bad_lexical_cast &e) {
        fprintf(stderr, "%s: bad entry address `%s'\n", argv[0], optarg);
        return EXIT_USAGE;
      }
      break;
    case 't':
      trace_file = optarg;
      break;
    case 'l':
      line_edit = true;
      break;
    case 'd':
      listing = true;
      break;
    case 'q':
      quiet_mode = true;
      break;
    case 'h':
      usage(argv[0]);
      return EXIT_HALTED;
    case 'V':
      printf("%s\n%s\n", PROGRAM, COPYRIGHT);
      return EXIT_HALTED;
    default:
      fprintf(stderr, "Try `%s --help' for more information.\n", argv[0]);
      return EXIT_USAGE;
    }
  }

  if (optind >= argc) {
    fprintf(stderr, "%s: object file expected\n", argv[0]);
    fprintf(stderr, "Try `%s --help' for more information.\n", argv[0]);
    return EXIT_USAGE;
  }

  Machine machine;
  std::vector<Image> images;
  for (int i = optind; i < argc; i++) {
    const char *exec_file = argv[i];
    int l = strlen(exec_file);
    if (l < 4 || strcasecmp(&exec_file[l-4], ".obj")) {
      fprintf(stderr, "object file expected (\"%s\" given)\n", exec_file);
      return EXIT_USAGE;
    }
    if (!quiet_mode && !listing) {
      printf("Loading %s\n", exec_file);
    }
    try {
      std::vector<uint8_t> bytes = read_object_file(exec_file);
      Image image;
      image.filename = exec_file;
      image.origin = load_image(machine.mem, bytes.empty() ? NULL : &bytes[0],
                                bytes.size());
      image.words = bytes.size() / 2 - 1;
      images.push_back(image);
    } catch (LoadError &e) {
      fprintf(stderr, "failed to load %s: %s\n", exec_file, e.what());
      return EXIT_USAGE;
    }
  }

  if (listing) {
    for (size_t i = 0; i < images.size(); i++) {
      disassemble_image(machine, images[i]);
    }
    return EXIT_HALTED;
  }

  machine.regs.PC = have_entry ? entry : images[0].origin;

  FILE *traceout = NULL;
  if (trace_file) {
    traceout = fopen(trace_file, "w");
    if (!traceout) {
      perror(trace_file);
      return EXIT_USAGE;
    }
  }

  if (!quiet_mode) {
    printf("%s\n%s\n%s\n\n", PROGRAM, COPYRIGHT, INFO);
  }
  fflush(stdout);

  FdInput fd_input(fileno(stdin));
  ReadlineInput readline_input;
  InputChannel *input = &fd_input;
  if (line_edit) {
    input = &readline_input;
  }
  FdOutput output(fileno(stdout));

  Keyboard keyboard(*input);
  Tracer tracer(traceout);

  int status = EXIT_HALTED;
  {
    // Set the terminal to non-echo mode, unless readline owns it.
    Terminal terminal(line_edit ? -1 : fileno(stdin));

    CPU cpu(machine, *input, output);
    cpu.attach(&keyboard);
    if (traceout) {
      cpu.attach(&tracer);
    }

    install_sigint();
    try {
      RunResult result = cpu.run(&signal_received);
      output.flush();
      switch (result.status) {
      case Halted:
        if (!quiet_mode) {
          printf("\nProgram halted\n");
        }
        break;
      case UnimplementedOpcode:
      case UnimplementedTrap:
        fprintf(stderr, "\n%s\n", result.describe().c_str());
        status = EXIT_ILLEGAL;
        break;
      case Interrupted:
        fprintf(stderr, "\n<Interrupted> %s\n", result.describe().c_str());
        status = EXIT_INTERRUPTED;
        break;
      }
    } catch (IoError &e) {
      fprintf(stderr, "%s\n", e.what());
      status = EXIT_USAGE;
    }
  }

  if (!quiet_mode) {
    printf("Instructions Run: %lu\n", machine.instructions);
  }
  if (traceout) {
    fclose(traceout);
  }

  return status;
}
