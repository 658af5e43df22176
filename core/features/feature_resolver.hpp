#ifndef HWENERGY_FEATURES_FEATURE_RESOLVER_HPP
#define HWENERGY_FEATURES_FEATURE_RESOLVER_HPP

#include <optional>
#include <string>
#include <vector>

namespace hwenergy {
namespace features {

// Product types reported in Device.product_type
constexpr const char *kModelP1Meter = "HWE-P1";
constexpr const char *kModelEnergySocket = "HWE-SKT";
constexpr const char *kModelWaterMeter = "HWE-WTR";
constexpr const char *kModelKwh1 = "HWE-KWH1";
constexpr const char *kModelKwh3 = "HWE-KWH3";
constexpr const char *kModelSdm230 = "SDM230-wifi";
constexpr const char *kModelSdm630 = "SDM630-wifi";

// Capabilities of one device model + firmware combination
struct FeatureSet {
    bool has_state = false;       // api/v1/state
    bool has_system = false;      // api/v1/system
    bool has_identify = false;    // api/v1/identify
    bool has_decryption = false;  // api/v1/decryption

    bool operator==(const FeatureSet &other) const {
        return has_state == other.has_state && has_system == other.has_system &&
               has_identify == other.has_identify && has_decryption == other.has_decryption;
    }
    bool operator!=(const FeatureSet &other) const { return !(*this == other); }
};

/**
 * @brief Parse a dot-separated numeric version ("4.19", "3.00")
 *
 * @return Components in order, or std::nullopt if any component is empty or non-numeric
 */
std::optional<std::vector<unsigned long>> parse_version(const std::string &version);

/**
 * @brief Compare two parsed versions component-wise
 *
 * Missing trailing components count as 0, so "4.19" == "4.19.0".
 * @return negative, 0 or positive like strcmp
 */
int compare_versions(const std::vector<unsigned long> &a, const std::vector<unsigned long> &b);

/**
 * @brief True if firmware is at least minimum
 *
 * Fails closed: absent or unparsable firmware is never "at least" anything.
 */
bool firmware_at_least(const std::optional<std::string> &firmware, const char *minimum);

/**
 * @brief Derive the capability set of a device
 *
 * Pure function of its inputs. Unknown or absent product types yield an all-false
 * set, which keeps read-only operations usable while refusing writes.
 */
FeatureSet resolve(const std::optional<std::string> &product_type, const std::optional<std::string> &firmware_version);

}  // namespace features
}  // namespace hwenergy

#endif  // HWENERGY_FEATURES_FEATURE_RESOLVER_HPP
