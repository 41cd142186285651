// FILE: src/cli/process_command.cpp
#include "cli/process_command.hpp"

#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

bool process_command(const std::string& line, tb::InteractionService& svc,
                     std::string& selection, CliConfig& config) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if (cmd.empty())
    return true;
  try {
    if (cmd == "help") {
      return handle_help(iss, svc, selection, config);
    } else if (cmd == "clear" || cmd == "cls") {
      return handle_clear(iss, svc, selection, config);
    } else if (cmd == "list" || cmd == "ls") {
      return handle_list(iss, svc, selection, config);
    } else if (cmd == "select") {
      return handle_select(iss, svc, selection, config);
    } else if (cmd == "run") {
      return handle_run(iss, svc, selection, config);
    } else if (cmd == "info") {
      return handle_info(iss, svc, selection, config);
    } else if (cmd == "errors") {
      return handle_errors(iss, svc, selection, config);
    } else if (cmd == "config") {
      return handle_config(iss, svc, selection, config);
    } else if (cmd == "exit" || cmd == "quit" || cmd == "q") {
      return handle_exit(iss, svc, selection, config);
    } else {
      std::cout << "Unknown command: " << cmd
                << ". Type 'help' for a list of commands.\n";
    }
  } catch (const std::exception& e) {
    std::cout << "Error: " << e.what() << "\n";
  }
  return true;
}
