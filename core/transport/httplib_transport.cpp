#include "httplib_transport.hpp"

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <memory>

#include "logging/logger.hpp"

namespace hwenergy {
namespace transport {

namespace {

// Socket waits may return a few ms early relative to steady_clock
constexpr std::chrono::milliseconds kTimerSlack(5);

bool is_content_type(const std::string &key) {
    static const std::string kName = "content-type";
    return key.size() == kName.size() && std::equal(key.begin(), key.end(), kName.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == b;
           });
}

}  // namespace

bool HttplibTransport::perform(const HttpRequest &request, std::chrono::milliseconds timeout, HttpResponse &response,
                               TransportFault &fault) {
    if (closed_.load()) {
        fault.kind = FaultKind::FAILURE;
        fault.cause = "Transport closed";
        return false;
    }

    auto client = std::make_unique<httplib::Client>("http://" + request.host);
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    // Per-socket-operation timeouts restart on every byte; this bounds the whole call
    client->set_max_timeout(timeout);
    client->set_keep_alive(false);

    // Content-Type travels as the content_type argument, not as a header
    httplib::Headers headers;
    std::string content_type;
    for (const auto &[key, value] : request.headers) {
        if (is_content_type(key)) {
            content_type = value;
        } else {
            headers.emplace(key, value);
        }
    }
    const std::string body = request.body.value_or("");

    auto started = std::chrono::steady_clock::now();

    auto send = [&]() -> httplib::Result {
        switch (request.method) {
            case Method::HTTP_PUT:
                return client->Put(request.path, headers, body, content_type);
            case Method::HTTP_DELETE:
                return client->Delete(request.path, headers, body, content_type);
            case Method::HTTP_GET:
            default:
                return client->Get(request.path, headers);
        }
    };
    httplib::Result result = send();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    bool deadline_exceeded = result ? elapsed > timeout : elapsed + kTimerSlack >= timeout;
    if (deadline_exceeded) {
        fault.kind = FaultKind::TIMEOUT;
        fault.cause = "Deadline of " + std::to_string(timeout.count()) + "ms exceeded after " +
                      std::to_string(elapsed.count()) + "ms";
        if (!result) {
            fault.cause += " (" + httplib::to_string(result.error()) + ")";
        }
        return false;
    }

    if (!result) {
        fault.kind = FaultKind::FAILURE;
        fault.cause = httplib::to_string(result.error());
        return false;
    }

    response.status = result->status;
    response.body = result->body;
    response.headers.clear();
    for (const auto &[key, value] : result->headers) {
        response.headers.emplace(key, value);
    }

    fault.kind = FaultKind::NONE;
    fault.cause.clear();
    return true;
}

void HttplibTransport::close() {
    if (!closed_.exchange(true)) {
        LOG_DEBUG("[Transport] Closed");
    }
}

}  // namespace transport
}  // namespace hwenergy
