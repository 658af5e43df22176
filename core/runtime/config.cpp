#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <vector>

#include "logging/logger.hpp"

namespace hwenergy {
namespace runtime {

bool validate_config(const ClientConfig &config, std::string &error) {
    if (config.device.host.empty()) {
        error = "device.host is required";
        return false;
    }
    if (config.device.host.find("://") != std::string::npos || config.device.host.find('/') != std::string::npos) {
        error = "device.host must be a bare host or host:port, got '" + config.device.host + "'";
        return false;
    }
    if (config.device.timeout_ms < 100 || config.device.timeout_ms > 120000) {
        error = "device.timeout_ms must be between 100 and 120000";
        return false;
    }

    if (!logging::string_to_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ClientConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"device", "logging"};
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

        if (yaml["device"]) {
            if (yaml["device"]["host"]) {
                config.device.host = yaml["device"]["host"].as<std::string>();
            }
            if (yaml["device"]["timeout_ms"]) {
                config.device.timeout_ms = yaml["device"]["timeout_ms"].as<int>();
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Device: " << config.device.host << " (timeout " << config.device.timeout_ms << "ms)");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
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

}  // namespace runtime
}  // namespace hwenergy
