// FILE: src/cli/command/command_config.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace {

void show_config(const CliConfig& config, const tb::DiscoveryOptions& active) {
  std::cout << "Configuration"
            << (config.loaded_config_path.empty() ? std::string(" (defaults)")
                                                  : " from '" + config.loaded_config_path + "'")
            << ":\n"
            << "  unit_dir:         " << config.unit_dir << "\n"
            << "  unit_prefix:      " << config.unit_prefix << "\n"
            << "  unit_suffix:      " << config.unit_suffix << "\n"
            << "  ordering_policy:  " << config.ordering_policy << "\n"
            << "  show_load_errors: " << (config.show_load_errors ? "true" : "false") << "\n"
            << "  unit_path_mode:   " << config.unit_path_mode << "\n"
            << "  history_size:     " << config.history_size << "\n";
  // Discovery settings are fixed for the host lifetime.
  std::cout << "Active discovery: '" << active.unit_dir.string() << "/" << active.prefix << "*"
            << active.suffix << "', " << tb::to_string(active.ordering) << " order\n";
}

}  // namespace

bool handle_config(std::istringstream& iss, tb::InteractionService& svc,
                   std::string& /*selection*/, CliConfig& config) {
  std::string sub;
  iss >> sub;
  if (sub.empty() || sub == "show") {
    show_config(config, svc.cmd_discovery_options());
    return true;
  }
  if (sub == "save") {
    std::string path = read_argument(iss);
    if (path.empty()) path = config.loaded_config_path.empty() ? "config.yaml" : config.loaded_config_path;
    if (write_config_to_file(config, path)) {
      std::cout << "Configuration saved to '" << path << "'." << std::endl;
    } else {
      std::cout << "Error: Could not write configuration to '" << path << "'." << std::endl;
    }
    return true;
  }
  std::cout << "Error: Unknown config subcommand '" << sub << "'. Use: show, save [file]." << std::endl;
  return true;
}

void print_help_config(const CliConfig& /*config*/) {
  print_help_from_file("help_config.txt");
}
