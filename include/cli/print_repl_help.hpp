// FILE: include/cli/print_repl_help.hpp
#pragma once
#include "cli_config.hpp"

void print_repl_help(const CliConfig& config);
