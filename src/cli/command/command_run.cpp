// FILE: src/cli/command/command_run.cpp
#include <iostream>
#include <sstream>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/report_printer.hpp"

bool handle_run(std::istringstream& iss,
                tb::InteractionService& svc,
                std::string& selection,
                CliConfig& /*config*/) {
    std::string arg = read_argument(iss);
    if (!arg.empty()) {
        auto resolved = svc.cmd_resolve_selection(arg);
        // An unresolvable argument is still dispatched so the kernel reports it.
        selection = resolved ? *resolved : arg;
    }

    auto report = svc.cmd_dispatch(selection);
    print_dispatch_report(report, report.status == tb::DispatchStatus::Failed ? std::cerr : std::cout);
    return true;
}

void print_help_run(const CliConfig& /*config*/) {
    print_help_from_file("help_run.txt");
}
