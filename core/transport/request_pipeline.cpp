#include "request_pipeline.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace hwenergy {
namespace transport {

RequestPipeline::RequestPipeline(std::string host, std::shared_ptr<ITransport> transport)
    : host_(std::move(host)), transport_(std::move(transport)) {}

RawResult RequestPipeline::execute(const std::string &path, Method method, const std::optional<nlohmann::json> &body,
                                   std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = method;
    request.host = host_;
    request.path = (!path.empty() && path.front() == '/') ? path : "/" + path;
    if (body) {
        request.body = body->dump();
        request.headers["Content-Type"] = "application/json";
    }

    LOG_DEBUG("[Pipeline] " << method_to_string(method) << " " << request.url() << " "
                            << request.body.value_or("<no body>"));

    HttpResponse response;
    TransportFault fault;
    if (!transport_->perform(request, timeout, response, fault)) {
        if (fault.kind == FaultKind::TIMEOUT) {
            LOG_WARN("[Pipeline] Timeout on " << method_to_string(method) << " " << request.url() << ": "
                                              << fault.cause);
            return RawResult::failure(
                errors::Error::timeout("Timeout occurred while connecting to the HomeWizard Energy device"));
        }
        LOG_ERROR("[Pipeline] Transport error on " << method_to_string(method) << " " << request.url() << ": "
                                                   << fault.cause);
        return RawResult::failure(errors::Error::transport(
            "Error occurred while communicating with the HomeWizard Energy device", fault.cause));
    }

    LOG_DEBUG("[Pipeline] " << response.status << " " << response.body);

    if (response.status == 403) {
        LOG_WARN("[Pipeline] Device at " << host_ << " reports its local API is disabled");
        return RawResult::failure(errors::Error::api_disabled());
    }

    if (response.status != 200) {
        LOG_WARN("[Pipeline] Unexpected status " << response.status << " from " << request.url());
        return RawResult::failure(errors::Error::unexpected_status(response.status));
    }

    ResponseBody result;
    if (response.header("Content-Type").find("application/json") != std::string::npos) {
        // Body-less 200s are common for PUT/DELETE
        if (response.body.empty()) {
            result.json = nlohmann::json::object();
            return RawResult::success(std::move(result));
        }

        try {
            result.json = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error &e) {
            LOG_ERROR("[Pipeline] Malformed JSON from " << request.url() << ": " << e.what());
            return RawResult::failure(errors::Error::transport(
                "Malformed response from the HomeWizard Energy device", "Invalid JSON body"));
        }
        return RawResult::success(std::move(result));
    }

    result.text = std::move(response.body);
    return RawResult::success(std::move(result));
}

}  // namespace transport
}  // namespace hwenergy
