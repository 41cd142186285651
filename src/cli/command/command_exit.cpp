// FILE: src/cli/command/command_exit.cpp
#include <sstream>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

bool handle_exit(std::istringstream& /*iss*/,
                 tb::InteractionService& /*svc*/,
                 std::string& /*selection*/,
                 CliConfig& /*config*/) {
    return false; // signal REPL exit
}

void print_help_exit(const CliConfig& /*config*/) {
    print_help_from_file("help_exit.txt");
}
