// FILE: src/cli/command/command_errors.cpp
#include <iostream>
#include <sstream>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/report_printer.hpp"

bool handle_errors(std::istringstream& /*iss*/,
                   tb::InteractionService& svc,
                   std::string& /*selection*/,
                   CliConfig& /*config*/) {
    print_load_errors(svc.cmd_load_errors(), std::cout);
    return true;
}

void print_help_errors(const CliConfig& /*config*/) {
    print_help_from_file("help_errors.txt");
}
