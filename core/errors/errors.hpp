#pragma once

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace hwenergy {
namespace errors {

/**
 * @brief Failure kinds surfaced by the device client
 *
 * The taxonomy is flat: a code plus the context fields of Error.
 * - TIMEOUT: deadline exceeded during a network call (retryable)
 * - TRANSPORT_ERROR: connection-level failure or malformed response (retryable)
 * - API_DISABLED: device answered 403, local API switched off
 * - UNEXPECTED_STATUS: any other non-200 response
 * - UNSUPPORTED: capability absent for this device
 * - UNSUPPORTED_API_VERSION: device speaks a protocol version this client does not
 * - INVALID_ARGUMENT: local validation failure, never reaches the network
 */
enum class ErrorCode {
    OK,
    TIMEOUT,
    TRANSPORT_ERROR,
    API_DISABLED,
    UNEXPECTED_STATUS,
    UNSUPPORTED,
    UNSUPPORTED_API_VERSION,
    INVALID_ARGUMENT
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::TIMEOUT:
            return "TIMEOUT";
        case ErrorCode::TRANSPORT_ERROR:
            return "TRANSPORT_ERROR";
        case ErrorCode::API_DISABLED:
            return "API_DISABLED";
        case ErrorCode::UNEXPECTED_STATUS:
            return "UNEXPECTED_STATUS";
        case ErrorCode::UNSUPPORTED:
            return "UNSUPPORTED";
        case ErrorCode::UNSUPPORTED_API_VERSION:
            return "UNSUPPORTED_API_VERSION";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief True for failures a caller may retry without user action
 */
inline bool is_retryable(ErrorCode code) { return code == ErrorCode::TIMEOUT || code == ErrorCode::TRANSPORT_ERROR; }

// Error value with the context of its kind. Fields not relevant to a code stay empty.
struct Error {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    std::string cause;      // TRANSPORT_ERROR: underlying fault
    int http_status = 0;    // UNEXPECTED_STATUS / API_DISABLED
    std::string operation;  // UNSUPPORTED
    std::string expected;   // UNSUPPORTED_API_VERSION
    std::string actual;     // UNSUPPORTED_API_VERSION
    std::string field;      // INVALID_ARGUMENT
    std::optional<std::string> hint;

    bool ok() const { return code == ErrorCode::OK; }

    std::string to_string() const {
        std::string out = error_code_to_string(code);
        if (!message.empty()) {
            out += ": " + message;
        }
        if (!cause.empty()) {
            out += " (" + cause + ")";
        }
        if (hint) {
            out += " [" + *hint + "]";
        }
        return out;
    }

    static Error timeout(const std::string &message) {
        Error e;
        e.code = ErrorCode::TIMEOUT;
        e.message = message;
        return e;
    }

    static Error transport(const std::string &message, const std::string &cause) {
        Error e;
        e.code = ErrorCode::TRANSPORT_ERROR;
        e.message = message;
        e.cause = cause;
        return e;
    }

    static Error api_disabled() {
        Error e;
        e.code = ErrorCode::API_DISABLED;
        e.http_status = 403;
        e.message = "API disabled. API must be enabled in the HomeWizard Energy app";
        return e;
    }

    static Error unexpected_status(int status) {
        Error e;
        e.code = ErrorCode::UNEXPECTED_STATUS;
        e.http_status = status;
        e.message = "API request error (" + std::to_string(status) + ")";
        return e;
    }

    static Error unsupported(const std::string &operation, const std::string &message) {
        Error e;
        e.code = ErrorCode::UNSUPPORTED;
        e.operation = operation;
        e.message = message;
        return e;
    }

    static Error unsupported_api_version(const std::string &expected, const std::string &actual) {
        Error e;
        e.code = ErrorCode::UNSUPPORTED_API_VERSION;
        e.expected = expected;
        e.actual = actual;
        e.message = "Unsupported API version '" + actual + "', expected version '" + expected + "'";
        return e;
    }

    static Error invalid_argument(const std::string &field, const std::string &reason,
                                  std::optional<std::string> hint = std::nullopt) {
        Error e;
        e.code = ErrorCode::INVALID_ARGUMENT;
        e.field = field;
        e.message = reason;
        e.hint = std::move(hint);
        return e;
    }
};

// Outcome of an operation without a payload
using Status = Error;

/**
 * @brief Outcome of an operation that yields a value
 *
 * On success error.ok() is true. value is normally present on success; operations that
 * have a designed "not applicable" outcome document it as success with no value.
 */
template <typename T>
struct Result {
    std::optional<T> value;
    Error error;

    bool ok() const { return error.ok(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result not_applicable() { return Result(); }

    static Result failure(Error e) {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

/**
 * @brief JSON rendering of an error, for CLI and diagnostics output
 */
inline nlohmann::json error_to_json(const Error &error) {
    nlohmann::json j = {{"code", error_code_to_string(error.code)}, {"message", error.message}};
    if (!error.cause.empty()) j["cause"] = error.cause;
    if (error.http_status != 0) j["http_status"] = error.http_status;
    if (!error.operation.empty()) j["operation"] = error.operation;
    if (!error.expected.empty()) j["expected"] = error.expected;
    if (!error.actual.empty()) j["actual"] = error.actual;
    if (!error.field.empty()) j["field"] = error.field;
    if (error.hint) j["hint"] = *error.hint;
    return j;
}

}  // namespace errors
}  // namespace hwenergy
