// FILE: src/cli/print_repl_help.cpp
#include <iostream>
#include "cli/print_repl_help.hpp"

void print_repl_help(const CliConfig& config) {
    std::cout << "Available shell commands:\n\n"
              << "  help [command]\n"
              << "    Show this help message, or detailed help for one command.\n\n"

              << "  clear | cls\n"
              << "    Clear the terminal screen.\n\n"

              << "  list | ls\n"
              << "    List the registered units; '*' marks the current selection.\n\n"

              << "  select [name|number]\n"
              << "    Pick the current unit. Without an argument, opens a picker.\n\n"

              << "  run [name|number]\n"
              << "    Run a unit (default: the current selection).\n\n"

              << "  info [name|number]\n"
              << "    Show a unit's metadata. File display mode: '" << config.unit_path_mode << "'.\n\n"

              << "  errors\n"
              << "    List problems found while loading units.\n\n"

              << "  config [show | save [file]]\n"
              << "    Show the configuration or write it to a YAML file.\n\n"

              << "  exit | quit | q\n"
              << "    Quit the shell.\n\n"

              << "Tab completes commands and unit names; Up/Down walk the history"
              << " (" << config.history_size << " entries kept).\n";
}
