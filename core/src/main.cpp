// hwenergy-cli
// Runs one device API operation and prints the result as JSON

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/device_client.hpp"
#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "model/json_codec.hpp"
#include "runtime/command_args.hpp"
#include "runtime/config.hpp"

namespace {

using hwenergy::client::DeviceClient;
using hwenergy::errors::Error;

void print_usage() {
    std::cerr << "Usage: hwenergy-cli [OPTIONS] COMMAND [ARGS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH       Path to config file (default: hwenergy.yaml)\n";
    std::cerr << "  --host=HOST         Device host, overrides the config file\n";
    std::cerr << "  --timeout-ms=N      Request timeout, overrides the config file\n";
    std::cerr << "  --log-level=LEVEL   debug, info, warn or error\n";
    std::cerr << "  --help, -h          Show this help\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  device | data | state | system | decryption | features | identify\n";
    std::cerr << "  set-state [power_on=BOOL] [switch_lock=BOOL] [brightness=N]\n";
    std::cerr << "  set-system cloud_enabled=BOOL\n";
    std::cerr << "  set-decryption [key=HEX] [aad=HEX]\n";
    std::cerr << "  reset-decryption [key] [aad]\n";
}

int report(const Error &error) {
    LOG_ERROR(error.to_string());
    std::cout << hwenergy::errors::error_to_json(error).dump(2) << "\n";
    return 1;
}

int run_command(DeviceClient &client, const std::string &command, const std::vector<std::string> &args) {
    using namespace hwenergy;

    if (command == "device") {
        auto result = client.fetch_device();
        if (!result.ok()) return report(result.error);
        std::cout << model::encode_device(*result.value).dump(2) << "\n";
        return 0;
    }

    if (command == "data") {
        auto result = client.fetch_metered_data();
        if (!result.ok()) return report(result.error);
        std::cout << model::encode_metered_data(*result.value).dump(2) << "\n";
        return 0;
    }

    if (command == "state") {
        auto result = client.fetch_switch_state();
        if (!result.ok()) return report(result.error);
        if (!result.value) {
            std::cout << "null\n";
            LOG_INFO("Device has no switchable state");
            return 0;
        }
        std::cout << model::encode_switch_state(*result.value).dump(2) << "\n";
        return 0;
    }

    if (command == "system") {
        auto result = client.fetch_system_settings();
        if (!result.ok()) return report(result.error);
        std::cout << model::encode_system_settings(*result.value).dump(2) << "\n";
        return 0;
    }

    if (command == "decryption") {
        auto result = client.fetch_decryption_status();
        if (!result.ok()) return report(result.error);
        std::cout << model::encode_decryption_status(*result.value).dump(2) << "\n";
        return 0;
    }

    if (command == "features") {
        auto result = client.resolve_features();
        if (!result.ok()) return report(result.error);
        nlohmann::json out = {{"has_state", result.value->has_state},
                              {"has_system", result.value->has_system},
                              {"has_identify", result.value->has_identify},
                              {"has_decryption", result.value->has_decryption}};
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (command == "identify") {
        auto status = client.identify();
        return status.ok() ? 0 : report(status);
    }

    if (command == "reset-decryption") {
        auto parsed = runtime::parse_reset_decryption_args(args);
        if (!parsed.ok()) return report(parsed.error);
        auto status = client.reset_decryption_keys(parsed.value->key, parsed.value->aad);
        return status.ok() ? 0 : report(status);
    }

    if (command == "set-state") {
        auto parsed = runtime::parse_state_args(args);
        if (!parsed.ok()) return report(parsed.error);
        auto status = client.set_switch_state(parsed.value->power_on, parsed.value->switch_lock,
                                              parsed.value->brightness);
        return status.ok() ? 0 : report(status);
    }

    if (command == "set-system") {
        auto parsed = runtime::parse_system_args(args);
        if (!parsed.ok()) return report(parsed.error);
        auto status = client.set_system_settings(parsed.value->cloud_enabled);
        return status.ok() ? 0 : report(status);
    }

    if (command == "set-decryption") {
        auto parsed = runtime::parse_decryption_args(args);
        if (!parsed.ok()) return report(parsed.error);
        auto status = client.set_decryption_keys(parsed.value->key, parsed.value->aad);
        return status.ok() ? 0 : report(status);
    }

    print_usage();
    return report(Error::invalid_argument("command", "Unknown command '" + command + "'"));
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path = "hwenergy.yaml";
    bool config_given = false;
    std::optional<std::string> host_override;
    std::optional<int> timeout_override;
    std::optional<std::string> level_override;
    std::string command;
    std::vector<std::string> command_args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!command.empty()) {
            command_args.push_back(arg);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            config_given = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            config_given = true;
        } else if (arg.rfind("--host=", 0) == 0) {
            host_override = arg.substr(7);
        } else if (arg.rfind("--timeout-ms=", 0) == 0) {
            try {
                timeout_override = std::stoi(arg.substr(13));
            } catch (const std::exception &) {
                std::cerr << "Invalid --timeout-ms value: " << arg.substr(13) << "\n";
                return 1;
            }
        } else if (arg.rfind("--log-level=", 0) == 0) {
            level_override = arg.substr(12);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    hwenergy::runtime::ClientConfig config;
    std::string error;

    // With --host the config file is optional
    if (config_given || !host_override || std::filesystem::exists(config_path)) {
        if (!std::filesystem::exists(config_path)) {
            // Using cerr here as logger might not be initialized/configured
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            std::cerr << "\nCreate a config file, specify --config=PATH or pass --host=HOST\n";
            return 1;
        }
        if (!hwenergy::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    if (host_override) config.device.host = *host_override;
    if (timeout_override) config.device.timeout_ms = *timeout_override;
    if (level_override) config.logging.level = *level_override;

    if (!hwenergy::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    hwenergy::logging::Logger::set_level(*hwenergy::logging::string_to_level(config.logging.level));

    DeviceClient client(config.device.host, std::chrono::milliseconds(config.device.timeout_ms));
    int rc = run_command(client, command, command_args);
    client.close();
    return rc;
}
