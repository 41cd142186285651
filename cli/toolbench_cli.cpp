// FILE: cli/toolbench_cli.cpp
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "kernel/kernel.hpp"
#include "kernel/interaction.hpp"

#include "cli/print_cli_help.hpp"
#include "cli/report_printer.hpp"
#include "cli/run_repl.hpp"

int main(int argc, char** argv) {
    // Fast path: help needs neither config nor discovery.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    CliConfig config;
    std::string custom_config_path;
    std::string unit_dir_override;

    const char* const short_opts = "hler:u:R";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"list", no_argument, nullptr, 'l'},
        {"errors", no_argument, nullptr, 'e'}, {"run", required_argument, nullptr, 'r'},
        {"units", required_argument, nullptr, 'u'}, {"repl", no_argument, nullptr, 'R'},
        {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    // First pass: settings that shape discovery.
    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) custom_config_path = optarg;
        else if (opt == 'u') unit_dir_override = optarg;
        else if (opt == '?') { print_cli_help(); return 1; }
    }
    optind = 1;

    std::string config_to_load = custom_config_path.empty() ? "config.yaml" : custom_config_path;
    load_or_create_config(config_to_load, config);
    if (!unit_dir_override.empty()) config.unit_dir = unit_dir_override;

    tb::Kernel kernel(to_discovery_options(config));
    tb::InteractionService svc(kernel);

    try {
        const auto& registry = svc.cmd_registry();
        print_discovery_summary(registry, svc.cmd_discovery_options(), std::cout);
        if (config.show_load_errors && !registry.errors().empty()) {
            print_load_errors(registry.errors(), std::cerr);
        }
    } catch (const tb::UnitError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    // Default selection, as a radio list would show it.
    std::string selection;
    if (!svc.cmd_registry().empty()) selection = svc.cmd_registry().units().front().name();

    bool did_any_action = false;
    bool start_repl_after_actions = false;
    bool any_run_failed = false;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'l':
            print_unit_list(svc.cmd_registry(), selection, std::cout);
            did_any_action = true;
            break;
        case 'e':
            print_load_errors(svc.cmd_load_errors(), std::cout);
            did_any_action = true;
            break;
        case 'r': {
            std::string target = optarg;
            if (auto resolved = svc.cmd_resolve_selection(target)) target = *resolved;
            selection = target;
            auto report = svc.cmd_dispatch(target);
            print_dispatch_report(report, report.ok() ? std::cout : std::cerr);
            any_run_failed = any_run_failed || !report.ok();
            did_any_action = true;
            break; }
        case 'R': start_repl_after_actions = true; break;
        case 'u':
        case 2001: break;
        default: print_cli_help(); return 1;
        }
    }

    if (start_repl_after_actions || !did_any_action) {
        if (did_any_action) {
            std::cout << "\n--- Command-line actions complete. Entering interactive shell. ---\n";
        }
        run_repl(svc, config, selection);
        return 0;
    }
    return any_run_failed ? 1 : 0;
}
