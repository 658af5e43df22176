#ifndef HWENERGY_MODEL_MODELS_HPP
#define HWENERGY_MODEL_MODELS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "timestamp.hpp"

namespace hwenergy {
namespace model {

// Identity of the device (`api` endpoint)
struct Device {
    std::optional<std::string> product_name;
    std::optional<std::string> product_type;
    std::optional<std::string> serial;
    std::optional<std::string> api_version;
    std::optional<std::string> firmware_version;
};

/**
 * @brief Kind of an external sub-meter
 *
 * Values follow the OMS device type allocation (OMS Vol.2, table 2).
 * UNKNOWN covers every type string this client does not recognize.
 */
enum class ExternalDeviceType : int {
    UNKNOWN = -1,
    GAS_METER = 3,
    HEAT_METER = 4,
    WARM_WATER_METER = 6,
    WATER_METER = 7,
    INLET_HEAT_METER = 12
};

// Total mapping: unrecognized strings yield UNKNOWN
ExternalDeviceType external_device_type_from_string(const std::string &value);
std::string external_device_type_to_string(ExternalDeviceType type);

// Sub-meter reading relayed by the primary device
struct ExternalDevice {
    std::optional<std::string> unique_id;
    ExternalDeviceType meter_type = ExternalDeviceType::UNKNOWN;
    std::optional<double> value;
    std::optional<std::string> unit;
    std::optional<Timestamp> timestamp;
};

// Readings from `api/v1/data`. Which fields are present depends on the device kind.
struct MeteredData {
    std::optional<std::string> wifi_ssid;
    std::optional<double> wifi_strength;

    std::optional<int64_t> smr_version;
    std::optional<std::string> meter_model;
    std::optional<std::string> unique_meter_id;

    std::optional<int64_t> active_tariff;

    std::optional<double> total_power_import_kwh;
    std::optional<double> total_power_import_t1_kwh;
    std::optional<double> total_power_import_t2_kwh;
    std::optional<double> total_power_import_t3_kwh;
    std::optional<double> total_power_import_t4_kwh;
    std::optional<double> total_power_export_kwh;
    std::optional<double> total_power_export_t1_kwh;
    std::optional<double> total_power_export_t2_kwh;
    std::optional<double> total_power_export_t3_kwh;
    std::optional<double> total_power_export_t4_kwh;

    std::optional<double> active_power_w;
    std::optional<double> active_power_l1_w;
    std::optional<double> active_power_l2_w;
    std::optional<double> active_power_l3_w;

    std::optional<double> active_voltage_l1_v;
    std::optional<double> active_voltage_l2_v;
    std::optional<double> active_voltage_l3_v;

    std::optional<double> active_current_l1_a;
    std::optional<double> active_current_l2_a;
    std::optional<double> active_current_l3_a;

    std::optional<double> active_frequency_hz;

    std::optional<int64_t> voltage_sag_l1_count;
    std::optional<int64_t> voltage_sag_l2_count;
    std::optional<int64_t> voltage_sag_l3_count;

    std::optional<int64_t> voltage_swell_l1_count;
    std::optional<int64_t> voltage_swell_l2_count;
    std::optional<int64_t> voltage_swell_l3_count;

    std::optional<int64_t> any_power_fail_count;
    std::optional<int64_t> long_power_fail_count;

    std::optional<double> active_power_average_w;
    std::optional<double> monthly_power_peak_w;
    std::optional<Timestamp> monthly_power_peak_timestamp;

    std::optional<double> total_gas_m3;
    std::optional<Timestamp> gas_timestamp;
    std::optional<std::string> gas_unique_id;

    std::optional<double> active_liter_lpm;
    std::optional<double> total_liter_m3;

    // Empty when the device reports no external meters
    std::vector<ExternalDevice> external_devices;
};

struct SwitchState {
    std::optional<bool> power_on;
    std::optional<bool> switch_lock;
    std::optional<int64_t> brightness;
};

struct SystemSettings {
    std::optional<bool> cloud_enabled;
};

struct DecryptionStatus {
    std::optional<bool> key_set;
    std::optional<bool> aad_set;
};

}  // namespace model
}  // namespace hwenergy

#endif  // HWENERGY_MODEL_MODELS_HPP
