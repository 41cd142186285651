// FILE: src/cli/command/command_list.cpp
#include <iostream>
#include <sstream>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/report_printer.hpp"

bool handle_list(std::istringstream& /*iss*/,
                 tb::InteractionService& svc,
                 std::string& selection,
                 CliConfig& /*config*/) {
    const auto& registry = svc.cmd_registry();
    if (registry.empty()) {
        std::cout << svc.cmd_no_units_guidance();
        return true;
    }
    print_unit_list(registry, selection, std::cout);
    if (!registry.errors().empty()) {
        std::cout << "\n" << registry.errors().size()
                  << " unit(s) failed to load; type 'errors' for details." << std::endl;
    }
    return true;
}

void print_help_list(const CliConfig& /*config*/) {
    print_help_from_file("help_list.txt");
}
