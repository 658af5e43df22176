#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "i_transport.hpp"

namespace hwenergy {
namespace transport {

/**
 * @brief ITransport backed by cpp-httplib
 *
 * Each perform() builds its own httplib::Client whose overall timeout is the call's
 * deadline (connect, send and a slowly trickled response all count against it), so a
 * timeout aborts only that call and concurrent callers never share timeout state.
 * Requires cpp-httplib 0.20 or newer for Client::set_max_timeout. A call that overruns
 * the deadline is reported as TIMEOUT even if a response arrived.
 */
class HttplibTransport : public ITransport {
public:
    HttplibTransport() = default;
    ~HttplibTransport() override = default;

    // Non-copyable
    HttplibTransport(const HttplibTransport &) = delete;
    HttplibTransport &operator=(const HttplibTransport &) = delete;

    bool perform(const HttpRequest &request, std::chrono::milliseconds timeout, HttpResponse &response,
                 TransportFault &fault) override;

    void close() override;
    bool is_closed() const override { return closed_.load(); }

private:
    std::atomic<bool> closed_{false};
};

}  // namespace transport
}  // namespace hwenergy
