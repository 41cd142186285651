// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

using namespace tb; // for fs

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Toolbench CLI configuration.";
    root["unit_dir"] = config.unit_dir;
    root["unit_prefix"] = config.unit_prefix;
    root["unit_suffix"] = config.unit_suffix;
    root["ordering_policy"] = config.ordering_policy;
    root["show_load_errors"] = config.show_load_errors;
    root["unit_path_mode"] = config.unit_path_mode;
    root["history_size"] = config.history_size;

    try {
        std::ofstream fout(path);
        if (!fout) return false;
        fout << root;
        return static_cast<bool>(fout);
    } catch (const std::exception&) {
        return false;
    }
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["unit_dir"]) config.unit_dir = root["unit_dir"].as<std::string>();
            if (root["unit_prefix"]) config.unit_prefix = root["unit_prefix"].as<std::string>();
            if (root["unit_suffix"]) config.unit_suffix = root["unit_suffix"].as<std::string>();
            if (root["ordering_policy"]) {
                auto policy = root["ordering_policy"].as<std::string>();
                if (parse_ordering_policy(policy)) {
                    config.ordering_policy = policy;
                } else {
                    std::cerr << "Warning: Unknown ordering_policy '" << policy << "' in '" << config_path
                              << "'. Using '" << config.ordering_policy << "'." << std::endl;
                }
            }
            if (root["show_load_errors"]) config.show_load_errors = root["show_load_errors"].as<bool>();
            if (root["unit_path_mode"]) config.unit_path_mode = root["unit_path_mode"].as<std::string>();
            if (root["history_size"]) config.history_size = root["history_size"].as<int>();
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        }
    } else {
        std::cerr << "Warning: Configuration file '" << config_path << "' not found. Using default settings." << std::endl;
    }
}

tb::DiscoveryOptions to_discovery_options(const CliConfig& config) {
    tb::DiscoveryOptions options;
    options.unit_dir = config.unit_dir;
    options.prefix = config.unit_prefix;
    options.suffix = config.unit_suffix;
    options.ordering = parse_ordering_policy(config.ordering_policy).value_or(OrderingPolicy::NumericId);
    return options;
}
