// FILE: src/cli/command/command_select.cpp
#include <iostream>
#include <sstream>
#include <vector>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/tui_editor.hpp"

bool handle_select(std::istringstream& iss,
                   tb::InteractionService& svc,
                   std::string& selection,
                   CliConfig& /*config*/) {
    const auto& registry = svc.cmd_registry();
    if (registry.empty()) {
        std::cout << "No units available to select." << std::endl;
        return true;
    }

    std::string arg = read_argument(iss);
    if (arg.empty()) {
        std::vector<tb::PickerEntry> entries;
        for (const auto& unit : registry.units()) {
            entries.push_back({unit.name(), unit.meta.description});
        }
        auto picked = tb::run_unit_picker(entries, selection);
        if (!picked) {
            std::cout << "Selection unchanged: '" << selection << "'." << std::endl;
            return true;
        }
        selection = *picked;
    } else {
        auto resolved = svc.cmd_resolve_selection(arg);
        if (!resolved) {
            std::cout << "Error: No unit named or numbered '" << arg << "'. Use 'list' to see the available units." << std::endl;
            return true;
        }
        selection = *resolved;
    }

    std::cout << "Selected '" << selection << "'." << std::endl;
    if (auto meta = svc.cmd_unit_info(selection); meta && !meta->description.empty()) {
        std::cout << "  " << meta->description << std::endl;
    }
    return true;
}

void print_help_select(const CliConfig& /*config*/) {
    print_help_from_file("help_select.txt");
}
