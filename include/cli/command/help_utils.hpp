// FILE: include/cli/command/help_utils.hpp
#pragma once
#include <string>

// Print help text from <help dir>/<filename>. The help dir is
// TOOLBENCH_HELP_DIR when the build defines it, else src/cli/command/help
// relative to the working directory.
// If the file cannot be opened, prints a default message.
void print_help_from_file(const std::string& filename);
