// FILE: src/cli/command/help_utils.cpp
#include "cli/command/help_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "cli/command/commands.hpp"

namespace fs = std::filesystem;

#ifndef TOOLBENCH_HELP_DIR
#define TOOLBENCH_HELP_DIR "src/cli/command/help"
#endif

void print_help_from_file(const std::string& filename) {
  fs::path path = fs::path(TOOLBENCH_HELP_DIR) / filename;
  std::ifstream in(path);
  if (!in) {
    std::cout << "(Help not available: " << path.string() << ")\n";
    return;
  }
  std::string line;
  while (std::getline(in, line)) {
    std::cout << line << '\n';
  }
}

std::string read_argument(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  const auto first = rest.find_first_not_of(" \t");
  if (first == std::string::npos) return "";
  const auto last = rest.find_last_not_of(" \t\r");
  return rest.substr(first, last - first + 1);
}
