// FILE: include/cli/print_cli_help.hpp
#pragma once

void print_cli_help();
