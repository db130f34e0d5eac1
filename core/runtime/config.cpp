#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <vector>

#include "../logging/logger.hpp"

namespace corral {
namespace runtime {

namespace {

std::optional<StoreBackend> parse_store_backend(const std::string &backend_str) {
    if (backend_str == "memory") {
        return StoreBackend::MEMORY;
    }
    if (backend_str == "json_file") {
        return StoreBackend::JSON_FILE;
    }
    return std::nullopt;
}

bool apply_yaml(const YAML::Node &yaml, CorralConfig &config, std::string &error) {
    if (!yaml || yaml.IsNull()) {
        // Empty document: defaults
        return validate_config(config, error);
    }
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    const std::vector<std::string> valid_keys = {"logging", "store", "stacks", "registry"};
    for (const auto &key_node : yaml) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
        }
    }

    // Load logging config
    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    // Load store config
    if (yaml["store"]) {
        if (yaml["store"]["backend"]) {
            auto backend_str = yaml["store"]["backend"].as<std::string>();
            auto backend = parse_store_backend(backend_str);
            if (!backend) {
                error = "Invalid store backend '" + backend_str + "': must be memory or json_file";
                return false;
            }
            config.store.backend = *backend;
        }
        if (yaml["store"]["path"]) {
            config.store.path = yaml["store"]["path"].as<std::string>();
        }
    }

    // Load stack catalog config
    if (yaml["stacks"]) {
        if (yaml["stacks"]["catalog"]) {
            config.stacks.catalog = yaml["stacks"]["catalog"].as<std::string>();
        }
    }

    // Load registry config
    if (yaml["registry"]) {
        if (yaml["registry"]["eager_load"]) {
            config.registry.eager_load = yaml["registry"]["eager_load"].as<bool>();
        }
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] Store: " << store_backend_to_string(config.store.backend)
                                << (config.store.path.empty() ? "" : " (" + config.store.path + ")"));
    LOG_INFO("[Config] Stack catalog: " << (config.stacks.catalog.empty() ? "none" : config.stacks.catalog));
    LOG_INFO("[Config] Eager load: " << (config.registry.eager_load ? "enabled" : "disabled"));
    LOG_INFO("[Config] Log level: " << config.logging.level);
    return true;
}

}  // namespace

std::string store_backend_to_string(StoreBackend backend) {
    switch (backend) {
        case StoreBackend::MEMORY:
            return "memory";
        case StoreBackend::JSON_FILE:
            return "json_file";
        default:
            return "unknown";
    }
}

bool validate_config(const CorralConfig &config, std::string &error) {
    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    // Validate Store settings
    if (config.store.backend == StoreBackend::JSON_FILE && config.store.path.empty()) {
        error = "store.path is required for the json_file backend";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, CorralConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        return apply_yaml(yaml, config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, CorralConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        return apply_yaml(yaml, config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace corral
