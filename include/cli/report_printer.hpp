// FILE: include/cli/report_printer.hpp
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "kernel/dispatcher.hpp"
#include "kernel/unit_registry.hpp"

// Console rendering of kernel results. The kernel itself never prints.

// "Loaded 3 unit(s) from 'build/units' (2 issue(s); type 'errors' to see them)."
void print_discovery_summary(const tb::UnitRegistry& registry, const tb::DiscoveryOptions& options,
                             std::ostream& os);

// Numbered list in display order; `selection` is marked with '*'.
void print_unit_list(const tb::UnitRegistry& registry, const std::string& selection, std::ostream& os);

// Every load error, labelled by kind.
void print_load_errors(const std::vector<tb::UnitLoadError>& errors, std::ostream& os);

void print_unit_info(const tb::UnitMetadata& meta, const CliConfig& config, std::ostream& os);

void print_dispatch_report(const tb::DispatchReport& report, std::ostream& os);
