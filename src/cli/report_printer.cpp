// FILE: src/cli/report_printer.cpp
#include "cli/report_printer.hpp"

#include <filesystem>
#include <iomanip>
#include <system_error>

namespace fs = std::filesystem;

void print_discovery_summary(const tb::UnitRegistry& registry, const tb::DiscoveryOptions& options,
                             std::ostream& os) {
    os << "Loaded " << registry.size() << " unit(s) from '" << options.unit_dir.string() << "'";
    if (!registry.errors().empty()) {
        os << " (" << registry.errors().size() << " issue(s); type 'errors' to see them)";
    }
    os << "." << std::endl;
}

void print_unit_list(const tb::UnitRegistry& registry, const std::string& selection, std::ostream& os) {
    if (registry.empty()) {
        os << "No units are registered." << std::endl;
        return;
    }
    os << "Available Tools (" << tb::to_string(registry.ordering()) << " order):" << std::endl;
    const auto& units = registry.units();
    for (size_t i = 0; i < units.size(); ++i) {
        const auto& meta = units[i].meta;
        os << (meta.display_name == selection ? "  * " : "    ")
           << std::setw(2) << (i + 1) << ". " << meta.display_name;
        if (!meta.description.empty()) os << "  - " << meta.description;
        os << std::endl;
    }
}

void print_load_errors(const std::vector<tb::UnitLoadError>& errors, std::ostream& os) {
    if (errors.empty()) {
        os << "No unit loading issues." << std::endl;
        return;
    }
    os << "Unit Loading Issues (" << errors.size() << "):" << std::endl;
    for (const auto& e : errors) {
        os << "  [" << tb::load_error_label(e.code) << "] " << e.message << std::endl;
    }
}

void print_unit_info(const tb::UnitMetadata& meta, const CliConfig& config, std::ostream& os) {
    os << meta.display_name << std::endl;
    if (!meta.description.empty()) os << "  " << meta.description << std::endl;
    os << "  File:  " << meta.file << std::endl;
    if (config.unit_path_mode == "absolute_path") {
        os << "  Path:  " << meta.source_path << std::endl;
    } else if (config.unit_path_mode == "relative_path") {
        std::error_code ec;
        auto rel = fs::relative(meta.source_path, ec);
        os << "  Path:  " << (ec ? meta.source_path : rel.string()) << std::endl;
    }
    os << "  Order: " << meta.order << std::endl;
    os << "  Id:    ";
    if (meta.numeric_id == tb::kUnnumberedUnitId) os << "(none)";
    else os << meta.numeric_id;
    os << std::endl;
}

void print_dispatch_report(const tb::DispatchReport& report, std::ostream& os) {
    switch (report.status) {
        case tb::DispatchStatus::Ok:
            os << "Finished '" << report.unit << "' in " << std::fixed << std::setprecision(1)
               << report.elapsed_ms << " ms." << std::defaultfloat << std::endl;
            return;
        case tb::DispatchStatus::NoUnits:
        case tb::DispatchStatus::UnknownSelection:
            os << report.guidance << std::endl;
            return;
        case tb::DispatchStatus::Failed:
            break;
    }

    os << "Error running '" << report.unit << "'" << std::endl;
    if (report.failure) {
        os << "  Error type: " << report.failure->kind << std::endl;
        os << "  Message:    " << report.failure->message << std::endl;
        os << "  Traceback:" << std::endl;
        for (size_t i = 0; i < report.failure->trace.size(); ++i) {
            os << "    #" << i << " " << report.failure->trace[i] << std::endl;
        }
    }
    os << report.guidance << std::endl;
}
