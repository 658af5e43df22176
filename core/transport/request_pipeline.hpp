#ifndef HWENERGY_TRANSPORT_REQUEST_PIPELINE_HPP
#define HWENERGY_TRANSPORT_REQUEST_PIPELINE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "errors/errors.hpp"
#include "i_transport.hpp"

namespace hwenergy {
namespace transport {

// Successful response body: parsed JSON when the device said so, raw text otherwise
struct ResponseBody {
    std::optional<nlohmann::json> json;
    std::string text;

    bool is_json() const { return json.has_value(); }
};

using RawResult = errors::Result<ResponseBody>;

/**
 * @brief Executes single device API calls and classifies their outcome
 *
 * Classification:
 * - transport deadline exceeded   -> TIMEOUT
 * - other transport fault         -> TRANSPORT_ERROR (cause attached)
 * - HTTP 403                      -> API_DISABLED
 * - any other non-200             -> UNEXPECTED_STATUS
 * - 200 with JSON content type    -> parsed JSON (unparsable body -> TRANSPORT_ERROR)
 * - 200 otherwise                 -> text
 *
 * Stateless apart from the shared transport; safe to use from several threads.
 */
class RequestPipeline {
public:
    RequestPipeline(std::string host, std::shared_ptr<ITransport> transport);

    /**
     * @brief Execute one call against http://<host>/<path>
     *
     * @param path Endpoint path relative to the device root, e.g. "api/v1/data"
     * @param method HTTP method
     * @param body Optional JSON body; Content-Type: application/json is set when present
     * @param timeout Hard deadline for this call only
     */
    RawResult execute(const std::string &path, Method method, const std::optional<nlohmann::json> &body,
                      std::chrono::milliseconds timeout) const;

    const std::string &host() const { return host_; }

private:
    std::string host_;
    std::shared_ptr<ITransport> transport_;
};

}  // namespace transport
}  // namespace hwenergy

#endif  // HWENERGY_TRANSPORT_REQUEST_PIPELINE_HPP
