#pragma once

#include <string>

namespace hwenergy {
namespace runtime {

struct DeviceConfig {
    std::string host;         // IP or hostname[:port] of the device (required)
    int timeout_ms = 10000;   // Per-request deadline (100-120000ms)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ClientConfig {
    DeviceConfig device;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ClientConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ClientConfig &config, std::string &error);

}  // namespace runtime
}  // namespace hwenergy
