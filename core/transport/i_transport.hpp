#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace hwenergy {
namespace transport {

using Headers = std::map<std::string, std::string>;

// Prefixed to avoid the DELETE macro from winnt.h
enum class Method { HTTP_GET, HTTP_PUT, HTTP_DELETE };

inline std::string method_to_string(Method method) {
    switch (method) {
        case Method::HTTP_GET:
            return "GET";
        case Method::HTTP_PUT:
            return "PUT";
        case Method::HTTP_DELETE:
            return "DELETE";
        default:
            return "GET";
    }
}

struct HttpRequest {
    Method method = Method::HTTP_GET;
    std::string host;  // "192.168.1.50" or "meter.local:8080"
    std::string path;  // always starts with '/'
    Headers headers;
    std::optional<std::string> body;

    std::string url() const { return "http://" + host + path; }
};

struct HttpResponse {
    int status = 0;
    Headers headers;
    std::string body;

    // Case-insensitive header lookup, empty string if absent
    std::string header(const std::string &name) const {
        for (const auto &[key, value] : headers) {
            if (key.size() == name.size() &&
                std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
                })) {
                return value;
            }
        }
        return "";
    }
};

enum class FaultKind {
    NONE,
    TIMEOUT,  // deadline exceeded, call aborted
    FAILURE   // any other transport-level fault
};

struct TransportFault {
    FaultKind kind = FaultKind::NONE;
    std::string cause;
};

// Interface for the HTTP transport to enable mocking
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Perform one HTTP request under a deadline
     *
     * Exactly one attempt, no retries. On false, fault describes what went wrong and
     * response is unspecified. Any HTTP status counts as success at this level.
     * Safe to call from several threads; each call is bounded by its own timeout.
     */
    virtual bool perform(const HttpRequest &request, std::chrono::milliseconds timeout, HttpResponse &response,
                         TransportFault &fault) = 0;

    // Release resources; later perform() calls fail
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

}  // namespace transport
}  // namespace hwenergy
