#include "device_client.hpp"

#include <utility>

#include "logging/logger.hpp"
#include "model/json_codec.hpp"
#include "transport/httplib_transport.hpp"
#include "validation.hpp"

namespace hwenergy {
namespace client {

namespace {

constexpr const char *kPathDevice = "api";
constexpr const char *kPathData = "api/v1/data";
constexpr const char *kPathState = "api/v1/state";
constexpr const char *kPathSystem = "api/v1/system";
constexpr const char *kPathIdentify = "api/v1/identify";
constexpr const char *kPathDecryption = "api/v1/decryption";

// Payload of a successful GET, or an empty object for a text body
const nlohmann::json &payload(const transport::ResponseBody &body) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!body.is_json()) {
        LOG_WARN("[DeviceClient] Expected JSON payload, got text; decoding as empty");
        return kEmpty;
    }
    return *body.json;
}

template <typename T>
errors::Result<T> refuse(const errors::Error &error) {
    return errors::Result<T>::failure(error);
}

}  // namespace

bool is_supported_api_version(const std::optional<std::string> &api_version) {
    if (!api_version) {
        return false;
    }
    std::string version = *api_version;
    if (!version.empty() && (version.front() == 'v' || version.front() == 'V')) {
        version.erase(0, 1);
    }
    return version == kSupportedApiVersion;
}

DeviceClient::DeviceClient(const std::string &host, std::chrono::milliseconds timeout)
    : transport_(std::make_shared<transport::HttplibTransport>()),
      owns_transport_(true),
      pipeline_(host, transport_),
      timeout_(timeout) {}

DeviceClient::DeviceClient(const std::string &host, std::shared_ptr<transport::ITransport> transport,
                           std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), owns_transport_(false), pipeline_(host, transport_), timeout_(timeout) {}

DeviceClient::~DeviceClient() { close(); }

void DeviceClient::close() {
    if (owns_transport_ && transport_ && !transport_->is_closed()) {
        LOG_DEBUG("[DeviceClient] Closing transport for " << host());
        transport_->close();
    }
}

errors::Result<transport::ResponseBody> DeviceClient::get(const std::string &path) const {
    return pipeline_.execute(path, transport::Method::HTTP_GET, std::nullopt, timeout_);
}

errors::Status DeviceClient::send(const std::string &path, transport::Method method,
                                  const std::optional<nlohmann::json> &body) const {
    auto result = pipeline_.execute(path, method, body, timeout_);
    return result.error;
}

errors::Result<model::Device> DeviceClient::fetch_device() {
    auto response = get(kPathDevice);
    if (!response.ok()) {
        return refuse<model::Device>(response.error);
    }

    model::Device device = model::decode_device(payload(*response.value));

    if (!is_supported_api_version(device.api_version)) {
        std::string actual = device.api_version.value_or("");
        LOG_ERROR("[DeviceClient] " << host() << " reports API version '" << actual << "', expected '"
                                    << kSupportedApiVersion << "'");
        cache_.invalidate();
        return refuse<model::Device>(errors::Error::unsupported_api_version(kSupportedApiVersion, actual));
    }

    auto resolved = cache_.store(device);
    LOG_DEBUG("[DeviceClient] " << device.product_type.value_or("<unknown>") << " firmware "
                                << device.firmware_version.value_or("<unknown>")
                                << ": state=" << resolved.feature_set.has_state
                                << " system=" << resolved.feature_set.has_system
                                << " identify=" << resolved.feature_set.has_identify
                                << " decryption=" << resolved.feature_set.has_decryption);
    return errors::Result<model::Device>::success(std::move(device));
}

errors::Result<features::FeatureSet> DeviceClient::resolve_features() {
    auto cached = cache_.get();
    if (cached) {
        return errors::Result<features::FeatureSet>::success(cached->feature_set);
    }

    auto device = fetch_device();
    if (!device.ok()) {
        return refuse<features::FeatureSet>(device.error);
    }
    return errors::Result<features::FeatureSet>::success(
        features::resolve(device.value->product_type, device.value->firmware_version));
}

errors::Status DeviceClient::require(bool features::FeatureSet::*capability, const std::string &operation,
                                     const std::string &message) {
    auto resolved = resolve_features();
    if (!resolved.ok()) {
        return resolved.error;
    }
    if (!((*resolved.value).*capability)) {
        LOG_WARN("[DeviceClient] " << message);
        return errors::Error::unsupported(operation, message);
    }
    return errors::Status();
}

errors::Result<model::MeteredData> DeviceClient::fetch_metered_data() {
    auto response = get(kPathData);
    if (!response.ok()) {
        return refuse<model::MeteredData>(response.error);
    }
    return errors::Result<model::MeteredData>::success(model::decode_metered_data(payload(*response.value)));
}

errors::Result<model::SwitchState> DeviceClient::fetch_switch_state() {
    auto resolved = resolve_features();
    if (!resolved.ok()) {
        return refuse<model::SwitchState>(resolved.error);
    }
    if (!resolved.value->has_state) {
        LOG_DEBUG("[DeviceClient] " << host() << " has no switchable state");
        return errors::Result<model::SwitchState>::not_applicable();
    }

    auto response = get(kPathState);
    if (!response.ok()) {
        return refuse<model::SwitchState>(response.error);
    }
    return errors::Result<model::SwitchState>::success(model::decode_switch_state(payload(*response.value)));
}

errors::Status DeviceClient::set_switch_state(std::optional<bool> power_on, std::optional<bool> switch_lock,
                                              std::optional<int64_t> brightness) {
    nlohmann::json state = nlohmann::json::object();
    if (power_on) state["power_on"] = *power_on;
    if (switch_lock) state["switch_lock"] = *switch_lock;
    if (brightness) state["brightness"] = *brightness;

    if (state.empty()) {
        LOG_WARN("[DeviceClient] At least one state update is required");
        return errors::Error::invalid_argument("state", "No fields provided: at least one state update is required");
    }

    auto gate = require(&features::FeatureSet::has_state, "set_switch_state",
                        "Setting state is not supported with this device");
    if (!gate.ok()) {
        return gate;
    }

    return send(kPathState, transport::Method::HTTP_PUT, state);
}

errors::Result<model::SystemSettings> DeviceClient::fetch_system_settings() {
    auto response = get(kPathSystem);
    if (!response.ok()) {
        return refuse<model::SystemSettings>(response.error);
    }
    return errors::Result<model::SystemSettings>::success(model::decode_system_settings(payload(*response.value)));
}

errors::Status DeviceClient::set_system_settings(std::optional<bool> cloud_enabled) {
    nlohmann::json system = nlohmann::json::object();
    if (cloud_enabled) system["cloud_enabled"] = *cloud_enabled;

    if (system.empty()) {
        LOG_WARN("[DeviceClient] At least one system update is required");
        return errors::Error::invalid_argument("system",
                                               "No fields provided: at least one system update is required");
    }

    auto gate = require(&features::FeatureSet::has_system, "set_system_settings",
                        "Setting system is not supported with this device");
    if (!gate.ok()) {
        return gate;
    }

    return send(kPathSystem, transport::Method::HTTP_PUT, system);
}

errors::Status DeviceClient::identify() {
    auto gate = require(&features::FeatureSet::has_identify, "identify", "Identify is not supported");
    if (!gate.ok()) {
        return gate;
    }
    return send(kPathIdentify, transport::Method::HTTP_PUT, std::nullopt);
}

errors::Result<model::DecryptionStatus> DeviceClient::fetch_decryption_status() {
    auto response = get(kPathDecryption);
    if (!response.ok()) {
        return refuse<model::DecryptionStatus>(response.error);
    }
    return errors::Result<model::DecryptionStatus>::success(
        model::decode_decryption_status(payload(*response.value)));
}

errors::Status DeviceClient::set_decryption_keys(const std::optional<std::string> &key,
                                                 const std::optional<std::string> &aad) {
    nlohmann::json data = nlohmann::json::object();

    if (key) {
        auto status = validate_decryption_key(*key);
        if (!status.ok()) {
            LOG_WARN("[DeviceClient] Rejected decryption key: " << status.message);
            return status;
        }
        data["key"] = *key;
    }

    if (aad) {
        auto status = validate_decryption_aad(*aad);
        if (!status.ok()) {
            LOG_WARN("[DeviceClient] Rejected AAD: " << status.message);
            return status;
        }
        data["aad"] = *aad;
    }

    if (data.empty()) {
        LOG_WARN("[DeviceClient] At least one decryption key is required");
        return errors::Error::invalid_argument("decryption",
                                               "No fields provided: at least one decryption key is required");
    }

    auto gate = require(&features::FeatureSet::has_decryption, "set_decryption_keys",
                        "Setting decryption is not supported with this device");
    if (!gate.ok()) {
        return gate;
    }

    return send(kPathDecryption, transport::Method::HTTP_PUT, data);
}

errors::Status DeviceClient::reset_decryption_keys(bool key, bool aad) {
    auto gate = require(&features::FeatureSet::has_decryption, "reset_decryption_keys",
                        "Setting decryption is not supported with this device");
    if (!gate.ok()) {
        return gate;
    }

    nlohmann::json data = {{"key", key}, {"aad", aad}};
    return send(kPathDecryption, transport::Method::HTTP_DELETE, data);
}

}  // namespace client
}  // namespace hwenergy
