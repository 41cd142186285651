// FILE: src/cli/command/command_info.cpp
#include <iostream>
#include <sstream>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/report_printer.hpp"

bool handle_info(std::istringstream& iss,
                 tb::InteractionService& svc,
                 std::string& selection,
                 CliConfig& config) {
    std::string arg = read_argument(iss);
    std::string name = selection;
    if (!arg.empty()) {
        auto resolved = svc.cmd_resolve_selection(arg);
        if (!resolved) {
            std::cout << "Error: No unit named or numbered '" << arg << "'." << std::endl;
            return true;
        }
        name = *resolved;
    }
    auto meta = svc.cmd_unit_info(name);
    if (!meta) {
        std::cout << "No unit selected." << std::endl;
        return true;
    }
    print_unit_info(*meta, config, std::cout);
    return true;
}

void print_help_info(const CliConfig& /*config*/) {
    print_help_from_file("help_info.txt");
}
