// FILE: include/cli/command/commands.hpp
#pragma once

#include <sstream>
#include <string>

#include "cli_config.hpp"
#include "kernel/interaction.hpp"

// Each command exposes two functions:
//  - handle_<command>: executes the command; returns whether to continue the REPL
//  - print_help_<command>: prints detailed help for the command
//
// `selection` is the shell's current unit (display name); commands may change it.

// help
bool handle_help(std::istringstream& iss, tb::InteractionService& svc,
                 std::string& selection, CliConfig& config);
void print_help_help(const CliConfig& config);

// clear / cls
bool handle_clear(std::istringstream& iss, tb::InteractionService& svc,
                  std::string& selection, CliConfig& config);
void print_help_clear(const CliConfig& config);

// list / ls
bool handle_list(std::istringstream& iss, tb::InteractionService& svc,
                 std::string& selection, CliConfig& config);
void print_help_list(const CliConfig& config);

// select
bool handle_select(std::istringstream& iss, tb::InteractionService& svc,
                   std::string& selection, CliConfig& config);
void print_help_select(const CliConfig& config);

// run
bool handle_run(std::istringstream& iss, tb::InteractionService& svc,
                std::string& selection, CliConfig& config);
void print_help_run(const CliConfig& config);

// info
bool handle_info(std::istringstream& iss, tb::InteractionService& svc,
                 std::string& selection, CliConfig& config);
void print_help_info(const CliConfig& config);

// errors
bool handle_errors(std::istringstream& iss, tb::InteractionService& svc,
                   std::string& selection, CliConfig& config);
void print_help_errors(const CliConfig& config);

// config
bool handle_config(std::istringstream& iss, tb::InteractionService& svc,
                   std::string& selection, CliConfig& config);
void print_help_config(const CliConfig& config);

// exit / quit / q
bool handle_exit(std::istringstream& iss, tb::InteractionService& svc,
                 std::string& selection, CliConfig& config);
void print_help_exit(const CliConfig& config);

// Rest of the line after the command word, trimmed. Unit names contain spaces.
std::string read_argument(std::istringstream& iss);
