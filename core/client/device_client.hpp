#ifndef HWENERGY_CLIENT_DEVICE_CLIENT_HPP
#define HWENERGY_CLIENT_DEVICE_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "device_cache.hpp"
#include "errors/errors.hpp"
#include "features/feature_resolver.hpp"
#include "model/models.hpp"
#include "transport/i_transport.hpp"
#include "transport/request_pipeline.hpp"

namespace hwenergy {
namespace client {

// The one API version this client understands ("v1" on the wire is the same version)
constexpr const char *kSupportedApiVersion = "1";

constexpr std::chrono::milliseconds kDefaultTimeout(10000);

/**
 * @brief Client for one HomeWizard Energy device
 *
 * Every operation follows the same path:
 * 1. validate arguments locally (INVALID_ARGUMENT), before any I/O
 * 2. resolve Device + FeatureSet (cached after the first fetch)
 * 3. refuse with UNSUPPORTED if the capability is missing
 * 4. one call through the RequestPipeline, decoded through the model
 * A refused operation never reaches its own endpoint.
 *
 * Thread model:
 * - Operations may be called concurrently; the device cache is locked, calls are
 *   not ordered relative to each other.
 * - Each call carries its own deadline; a timeout affects only that call.
 *
 * Ownership:
 * - A client constructed without a transport creates one and closes it in close()
 *   or on destruction.
 * - A transport passed in stays owned by the caller and is never closed here.
 */
class DeviceClient {
public:
    explicit DeviceClient(const std::string &host, std::chrono::milliseconds timeout = kDefaultTimeout);
    DeviceClient(const std::string &host, std::shared_ptr<transport::ITransport> transport,
                 std::chrono::milliseconds timeout = kDefaultTimeout);
    ~DeviceClient();

    // Non-copyable
    DeviceClient(const DeviceClient &) = delete;
    DeviceClient &operator=(const DeviceClient &) = delete;

    const std::string &host() const { return pipeline_.host(); }
    std::chrono::milliseconds timeout() const { return timeout_; }

    // GET api. Always refetches and, if the API version is supported, refreshes the cache.
    errors::Result<model::Device> fetch_device();

    // Cached capabilities, fetching the device on first use
    errors::Result<features::FeatureSet> resolve_features();

    // Drop the cached device; the next gated operation refetches it
    void invalidate() { cache_.invalidate(); }

    // GET api/v1/data
    errors::Result<model::MeteredData> fetch_metered_data();

    // GET api/v1/state. Success with no value when the device has no switchable state.
    errors::Result<model::SwitchState> fetch_switch_state();

    // PUT api/v1/state. At least one field required.
    errors::Status set_switch_state(std::optional<bool> power_on = std::nullopt,
                                    std::optional<bool> switch_lock = std::nullopt,
                                    std::optional<int64_t> brightness = std::nullopt);

    // GET api/v1/system
    errors::Result<model::SystemSettings> fetch_system_settings();

    // PUT api/v1/system. At least one field required.
    errors::Status set_system_settings(std::optional<bool> cloud_enabled = std::nullopt);

    // PUT api/v1/identify (blinks the status LED)
    errors::Status identify();

    // GET api/v1/decryption
    errors::Result<model::DecryptionStatus> fetch_decryption_status();

    // PUT api/v1/decryption. key: 32 hex chars, aad: 34 hex chars, at least one of them.
    errors::Status set_decryption_keys(const std::optional<std::string> &key = std::nullopt,
                                       const std::optional<std::string> &aad = std::nullopt);

    // DELETE api/v1/decryption
    errors::Status reset_decryption_keys(bool key = false, bool aad = false);

    // Release the transport if this client created it. Idempotent.
    void close();

private:
    std::shared_ptr<transport::ITransport> transport_;
    bool owns_transport_;
    transport::RequestPipeline pipeline_;
    std::chrono::milliseconds timeout_;
    DeviceCache cache_;

    // Gate an operation on a capability: OK status, or UNSUPPORTED / fetch failure
    errors::Status require(bool features::FeatureSet::*capability, const std::string &operation,
                           const std::string &message);

    errors::Result<transport::ResponseBody> get(const std::string &path) const;
    errors::Status send(const std::string &path, transport::Method method,
                        const std::optional<nlohmann::json> &body) const;
};

// True if a device-reported version string names the supported version ("1" or "v1")
bool is_supported_api_version(const std::optional<std::string> &api_version);

}  // namespace client
}  // namespace hwenergy

#endif  // HWENERGY_CLIENT_DEVICE_CLIENT_HPP
