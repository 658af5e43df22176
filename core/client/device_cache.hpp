#ifndef HWENERGY_CLIENT_DEVICE_CACHE_HPP
#define HWENERGY_CLIENT_DEVICE_CACHE_HPP

#include <mutex>
#include <optional>

#include "features/feature_resolver.hpp"
#include "model/models.hpp"

namespace hwenergy {
namespace client {

// Device identity together with the capabilities derived from it
struct ResolvedDevice {
    model::Device device;
    features::FeatureSet feature_set;
};

/**
 * @brief Per-client cache of the resolved device
 *
 * Thread Safety: all methods lock; get() returns a copy.
 *
 * The feature set is always derived from the device stored with it, so the two can
 * only change together through store().
 */
class DeviceCache {
public:
    DeviceCache() = default;

    DeviceCache(const DeviceCache &) = delete;
    DeviceCache &operator=(const DeviceCache &) = delete;

    std::optional<ResolvedDevice> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entry_;
    }

    // Replace the cached device and re-derive its features
    ResolvedDevice store(const model::Device &device) {
        ResolvedDevice entry{device, features::resolve(device.product_type, device.firmware_version)};
        std::lock_guard<std::mutex> lock(mutex_);
        entry_ = entry;
        return entry;
    }

    void invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        entry_.reset();
    }

private:
    mutable std::mutex mutex_;
    std::optional<ResolvedDevice> entry_;
};

}  // namespace client
}  // namespace hwenergy

#endif  // HWENERGY_CLIENT_DEVICE_CACHE_HPP
