// FILE: src/cli/command/command_help.cpp
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/print_repl_help.hpp"

// Helper to canonicalize command names and aliases
static std::string canonicalize(const std::string& cmd) {
  static const std::unordered_map<std::string, std::string> alias = {
      {"cls", "clear"},
      {"ls", "list"},
      {"q", "exit"},
      {"quit", "exit"}};
  auto it = alias.find(cmd);
  return (it == alias.end()) ? cmd : it->second;
}

// Dispatcher for printing specific command help
static bool dispatch_print(const std::string& name, const CliConfig& config) {
  const std::string cmd = canonicalize(name);
  if (cmd == "help") {
    print_help_help(config);
  } else if (cmd == "clear") {
    print_help_clear(config);
  } else if (cmd == "list") {
    print_help_list(config);
  } else if (cmd == "select") {
    print_help_select(config);
  } else if (cmd == "run") {
    print_help_run(config);
  } else if (cmd == "info") {
    print_help_info(config);
  } else if (cmd == "errors") {
    print_help_errors(config);
  } else if (cmd == "config") {
    print_help_config(config);
  } else if (cmd == "exit") {
    print_help_exit(config);
  } else {
    return false;
  }
  return true;
}

bool handle_help(std::istringstream& iss, tb::InteractionService& /*svc*/,
                 std::string& /*selection*/, CliConfig& config) {
  std::string sub;
  if (!(iss >> sub)) {
    print_repl_help(config);
    return true;
  }
  if (!dispatch_print(sub, config)) {
    std::cout << "Unknown command for help: '" << sub << "'\n";
  }
  return true;
}

void print_help_help(const CliConfig& /*config*/) {
  print_help_from_file("help_help.txt");
}
