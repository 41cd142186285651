// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: toolbench [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -l, --list                 List the registered units\n"
      << "  -e, --errors               List unit loading issues\n"
      << "  -r, --run <name|number>    Run a unit (repeatable, runs in order)\n"
      << "  -u, --units <dir>          Discover units in <dir> instead of the configured one\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "      --repl                 Start the interactive shell after the actions above\n"
      << "\n"
      << "Without -l, -e or -r the interactive shell starts.\n"
      << std::endl;
}
