#pragma once

#include <string>

namespace corral {
namespace runtime {

enum class StoreBackend { MEMORY, JSON_FILE };

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct StoreConfig {
    StoreBackend backend = StoreBackend::MEMORY;
    std::string path;  // Required for JSON_FILE
};

struct StacksConfig {
    std::string catalog;  // Optional path to a JSON stack catalog
};

struct RegistryConfig {
    bool eager_load = false;  // Hydrate during Runtime::initialize instead of first use
};

struct CorralConfig {
    LoggingConfig logging;
    StoreConfig store;
    StacksConfig stacks;
    RegistryConfig registry;
};

std::string store_backend_to_string(StoreBackend backend);

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, CorralConfig &config, std::string &error);

// Loads configuration from YAML text (same rules as load_config)
bool load_config_from_string(const std::string &yaml_text, CorralConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const CorralConfig &config, std::string &error);

}  // namespace runtime
}  // namespace corral
