#pragma once

#include <nlohmann/json.hpp>

#include "models.hpp"

namespace hwenergy {
namespace model {

/**
 * @brief JSON decoding of device payloads
 *
 * Decoding is lenient. Every recognized key is listed explicitly; unknown keys are
 * ignored, and a missing key, a null, or a value of the wrong JSON type leaves the
 * field absent. A payload that is not an object decodes to an all-absent record.
 * None of these functions throw.
 */
Device decode_device(const nlohmann::json &json);
MeteredData decode_metered_data(const nlohmann::json &json);
ExternalDevice decode_external_device(const nlohmann::json &json);
SwitchState decode_switch_state(const nlohmann::json &json);
SystemSettings decode_system_settings(const nlohmann::json &json);
DecryptionStatus decode_decryption_status(const nlohmann::json &json);

// Encoders emit present fields only; timestamps as ISO-8601 strings
nlohmann::json encode_device(const Device &device);
nlohmann::json encode_metered_data(const MeteredData &data);
nlohmann::json encode_external_device(const ExternalDevice &device);
nlohmann::json encode_switch_state(const SwitchState &state);
nlohmann::json encode_system_settings(const SystemSettings &settings);
nlohmann::json encode_decryption_status(const DecryptionStatus &status);

}  // namespace model
}  // namespace hwenergy
