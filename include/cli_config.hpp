// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>

#include "kernel/discovery_options.hpp"
#include "tb_types.hpp"

// Note: Keep this struct in the global namespace to match existing usage
// in cli/toolbench_cli.cpp and the command handlers.
struct CliConfig {
    std::string loaded_config_path;
    std::string unit_dir = "build/units";
    std::string unit_prefix = tb::kDefaultUnitPrefix;
    std::string unit_suffix = tb::default_unit_suffix();
    std::string ordering_policy = "numeric_id";
    bool show_load_errors = false;
    // How `info` prints a unit's source: name_only | relative_path | absolute_path
    std::string unit_path_mode = "name_only";
    int history_size = 1000;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// Discovery settings for the kernel. An unknown ordering_policy falls back to
// numeric_id.
tb::DiscoveryOptions to_discovery_options(const CliConfig& config);
