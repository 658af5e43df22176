#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors/errors.hpp"

namespace hwenergy {
namespace runtime {

// set-state [power_on=BOOL] [switch_lock=BOOL] [brightness=N]
struct StateArgs {
    std::optional<bool> power_on;
    std::optional<bool> switch_lock;
    std::optional<int64_t> brightness;
};

// set-system cloud_enabled=BOOL
struct SystemArgs {
    std::optional<bool> cloud_enabled;
};

// set-decryption [key=HEX] [aad=HEX]
struct DecryptionArgs {
    std::optional<std::string> key;
    std::optional<std::string> aad;
};

// reset-decryption [key] [aad]
struct ResetDecryptionArgs {
    bool key = false;
    bool aad = false;
};

/**
 * @brief Parsers for the arguments that follow a CLI command
 *
 * Every failure is INVALID_ARGUMENT with the offending field, so the CLI reports it
 * like any other error. Only the syntax is checked here; "at least one field" and
 * value rules stay with the DeviceClient operation.
 */
errors::Result<StateArgs> parse_state_args(const std::vector<std::string> &args);
errors::Result<SystemArgs> parse_system_args(const std::vector<std::string> &args);
errors::Result<DecryptionArgs> parse_decryption_args(const std::vector<std::string> &args);
errors::Result<ResetDecryptionArgs> parse_reset_decryption_args(const std::vector<std::string> &args);

// Accepts true/false, on/off, 1/0
std::optional<bool> parse_bool(const std::string &text);

}  // namespace runtime
}  // namespace hwenergy
