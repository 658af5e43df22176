#include "command_args.hpp"

#include <map>
#include <stdexcept>
#include <utility>

namespace hwenergy {
namespace runtime {

namespace {

using errors::Error;

// "name=value" arguments; a repeated name keeps its last value
errors::Status split_assignments(const std::vector<std::string> &args, std::map<std::string, std::string> &out) {
    for (const auto &arg : args) {
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error::invalid_argument("arguments", "Expected name=value, got '" + arg + "'");
        }
        out[arg.substr(0, eq)] = arg.substr(eq + 1);
    }
    return errors::Status();
}

Error unknown_field(const std::string &name, const std::string &command) {
    return Error::invalid_argument(name, "Unknown field '" + name + "' for " + command);
}

Error invalid_bool(const std::string &name, const std::string &value) {
    return Error::invalid_argument(name, "Expected true/false for " + name + ", got '" + value + "'");
}

}  // namespace

std::optional<bool> parse_bool(const std::string &text) {
    if (text == "true" || text == "on" || text == "1") return true;
    if (text == "false" || text == "off" || text == "0") return false;
    return std::nullopt;
}

errors::Result<StateArgs> parse_state_args(const std::vector<std::string> &args) {
    std::map<std::string, std::string> fields;
    auto status = split_assignments(args, fields);
    if (!status.ok()) {
        return errors::Result<StateArgs>::failure(status);
    }

    StateArgs parsed;
    for (const auto &[name, value] : fields) {
        if (name == "power_on" || name == "switch_lock") {
            auto flag = parse_bool(value);
            if (!flag) {
                return errors::Result<StateArgs>::failure(invalid_bool(name, value));
            }
            (name == "power_on" ? parsed.power_on : parsed.switch_lock) = *flag;
        } else if (name == "brightness") {
            try {
                size_t used = 0;
                long long brightness = std::stoll(value, &used);
                if (used != value.size()) {
                    throw std::invalid_argument("trailing characters");
                }
                parsed.brightness = brightness;
            } catch (const std::exception &) {
                return errors::Result<StateArgs>::failure(
                    Error::invalid_argument("brightness", "Expected an integer brightness, got '" + value + "'"));
            }
        } else {
            return errors::Result<StateArgs>::failure(unknown_field(name, "set-state"));
        }
    }
    return errors::Result<StateArgs>::success(std::move(parsed));
}

errors::Result<SystemArgs> parse_system_args(const std::vector<std::string> &args) {
    std::map<std::string, std::string> fields;
    auto status = split_assignments(args, fields);
    if (!status.ok()) {
        return errors::Result<SystemArgs>::failure(status);
    }

    SystemArgs parsed;
    for (const auto &[name, value] : fields) {
        if (name != "cloud_enabled") {
            return errors::Result<SystemArgs>::failure(unknown_field(name, "set-system"));
        }
        auto flag = parse_bool(value);
        if (!flag) {
            return errors::Result<SystemArgs>::failure(invalid_bool(name, value));
        }
        parsed.cloud_enabled = *flag;
    }
    return errors::Result<SystemArgs>::success(std::move(parsed));
}

errors::Result<DecryptionArgs> parse_decryption_args(const std::vector<std::string> &args) {
    std::map<std::string, std::string> fields;
    auto status = split_assignments(args, fields);
    if (!status.ok()) {
        return errors::Result<DecryptionArgs>::failure(status);
    }

    DecryptionArgs parsed;
    for (const auto &[name, value] : fields) {
        if (name == "key") {
            parsed.key = value;
        } else if (name == "aad") {
            parsed.aad = value;
        } else {
            return errors::Result<DecryptionArgs>::failure(unknown_field(name, "set-decryption"));
        }
    }
    return errors::Result<DecryptionArgs>::success(std::move(parsed));
}

errors::Result<ResetDecryptionArgs> parse_reset_decryption_args(const std::vector<std::string> &args) {
    ResetDecryptionArgs parsed;
    for (const auto &arg : args) {
        if (arg == "key") {
            parsed.key = true;
        } else if (arg == "aad") {
            parsed.aad = true;
        } else {
            return errors::Result<ResetDecryptionArgs>::failure(
                Error::invalid_argument(arg, "reset-decryption takes 'key' and/or 'aad', got '" + arg + "'"));
        }
    }
    return errors::Result<ResetDecryptionArgs>::success(parsed);
}

}  // namespace runtime
}  // namespace hwenergy
