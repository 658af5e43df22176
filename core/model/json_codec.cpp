#include "json_codec.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace hwenergy {
namespace model {

namespace {

using nlohmann::json;

// Field present and not null, or nullptr
const json *find_field(const json &obj, const char *key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<std::string> get_string(const json &obj, const char *key) {
    const json *v = find_field(obj, key);
    if (v == nullptr || !v->is_string()) {
        return std::nullopt;
    }
    return v->get<std::string>();
}

std::optional<double> get_double(const json &obj, const char *key) {
    const json *v = find_field(obj, key);
    if (v == nullptr || !v->is_number()) {
        return std::nullopt;
    }
    return v->get<double>();
}

std::optional<int64_t> get_int(const json &obj, const char *key) {
    const json *v = find_field(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (v->is_number_unsigned()) {
        auto u = v->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(u);
    }
    if (v->is_number_integer()) {
        return v->get<int64_t>();
    }
    if (v->is_number_float()) {
        // Some firmware emits counters as 12.0
        double d = v->get<double>();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const json &obj, const char *key) {
    const json *v = find_field(obj, key);
    if (v == nullptr || !v->is_boolean()) {
        return std::nullopt;
    }
    return v->get<bool>();
}

std::optional<Timestamp> get_timestamp(const json &obj, const char *key) {
    const json *v = find_field(obj, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    return parse_compact_timestamp(*v);
}

template <typename T>
void put(json &out, const char *key, const std::optional<T> &value) {
    if (value) {
        out[key] = *value;
    }
}

void put(json &out, const char *key, const std::optional<Timestamp> &value) {
    if (value) {
        out[key] = value->to_iso8601();
    }
}

// Wire keys of MeteredData, grouped by value type
struct StringField {
    const char *key;
    std::optional<std::string> MeteredData::*member;
};

struct DoubleField {
    const char *key;
    std::optional<double> MeteredData::*member;
};

struct IntField {
    const char *key;
    std::optional<int64_t> MeteredData::*member;
};

struct TimestampField {
    const char *key;
    std::optional<Timestamp> MeteredData::*member;
};

const StringField kStringFields[] = {
    {"wifi_ssid", &MeteredData::wifi_ssid},
    {"meter_model", &MeteredData::meter_model},
    {"unique_id", &MeteredData::unique_meter_id},
    {"gas_unique_id", &MeteredData::gas_unique_id},
};

const DoubleField kDoubleFields[] = {
    {"wifi_strength", &MeteredData::wifi_strength},
    {"total_power_import_kwh", &MeteredData::total_power_import_kwh},
    {"total_power_import_t1_kwh", &MeteredData::total_power_import_t1_kwh},
    {"total_power_import_t2_kwh", &MeteredData::total_power_import_t2_kwh},
    {"total_power_import_t3_kwh", &MeteredData::total_power_import_t3_kwh},
    {"total_power_import_t4_kwh", &MeteredData::total_power_import_t4_kwh},
    {"total_power_export_kwh", &MeteredData::total_power_export_kwh},
    {"total_power_export_t1_kwh", &MeteredData::total_power_export_t1_kwh},
    {"total_power_export_t2_kwh", &MeteredData::total_power_export_t2_kwh},
    {"total_power_export_t3_kwh", &MeteredData::total_power_export_t3_kwh},
    {"total_power_export_t4_kwh", &MeteredData::total_power_export_t4_kwh},
    {"active_power_w", &MeteredData::active_power_w},
    {"active_power_l1_w", &MeteredData::active_power_l1_w},
    {"active_power_l2_w", &MeteredData::active_power_l2_w},
    {"active_power_l3_w", &MeteredData::active_power_l3_w},
    {"active_voltage_l1_v", &MeteredData::active_voltage_l1_v},
    {"active_voltage_l2_v", &MeteredData::active_voltage_l2_v},
    {"active_voltage_l3_v", &MeteredData::active_voltage_l3_v},
    {"active_current_l1_a", &MeteredData::active_current_l1_a},
    {"active_current_l2_a", &MeteredData::active_current_l2_a},
    {"active_current_l3_a", &MeteredData::active_current_l3_a},
    {"active_frequency_hz", &MeteredData::active_frequency_hz},
    {"active_power_average_w", &MeteredData::active_power_average_w},
    // "montly" is the device's spelling
    {"montly_power_peak_w", &MeteredData::monthly_power_peak_w},
    {"total_gas_m3", &MeteredData::total_gas_m3},
    {"active_liter_lpm", &MeteredData::active_liter_lpm},
    {"total_liter_m3", &MeteredData::total_liter_m3},
};

const IntField kIntFields[] = {
    {"smr_version", &MeteredData::smr_version},
    {"active_tariff", &MeteredData::active_tariff},
    {"voltage_sag_l1_count", &MeteredData::voltage_sag_l1_count},
    {"voltage_sag_l2_count", &MeteredData::voltage_sag_l2_count},
    {"voltage_sag_l3_count", &MeteredData::voltage_sag_l3_count},
    {"voltage_swell_l1_count", &MeteredData::voltage_swell_l1_count},
    {"voltage_swell_l2_count", &MeteredData::voltage_swell_l2_count},
    {"voltage_swell_l3_count", &MeteredData::voltage_swell_l3_count},
    {"any_power_fail_count", &MeteredData::any_power_fail_count},
    {"long_power_fail_count", &MeteredData::long_power_fail_count},
};

const TimestampField kTimestampFields[] = {
    {"montly_power_peak_timestamp", &MeteredData::monthly_power_peak_timestamp},
    {"gas_timestamp", &MeteredData::gas_timestamp},
};

}  // namespace

ExternalDeviceType external_device_type_from_string(const std::string &value) {
    if (value == "gas_meter") return ExternalDeviceType::GAS_METER;
    if (value == "heat_meter") return ExternalDeviceType::HEAT_METER;
    if (value == "warm_water_meter") return ExternalDeviceType::WARM_WATER_METER;
    if (value == "water_meter") return ExternalDeviceType::WATER_METER;
    if (value == "inlet_heat_meter") return ExternalDeviceType::INLET_HEAT_METER;
    return ExternalDeviceType::UNKNOWN;
}

std::string external_device_type_to_string(ExternalDeviceType type) {
    switch (type) {
        case ExternalDeviceType::GAS_METER:
            return "gas_meter";
        case ExternalDeviceType::HEAT_METER:
            return "heat_meter";
        case ExternalDeviceType::WARM_WATER_METER:
            return "warm_water_meter";
        case ExternalDeviceType::WATER_METER:
            return "water_meter";
        case ExternalDeviceType::INLET_HEAT_METER:
            return "inlet_heat_meter";
        default:
            return "unknown";
    }
}

Device decode_device(const nlohmann::json &json) {
    Device device;
    device.product_name = get_string(json, "product_name");
    device.product_type = get_string(json, "product_type");
    device.serial = get_string(json, "serial");
    device.api_version = get_string(json, "api_version");
    device.firmware_version = get_string(json, "firmware_version");
    return device;
}

ExternalDevice decode_external_device(const nlohmann::json &json) {
    ExternalDevice device;
    device.unique_id = get_string(json, "unique_id");
    auto type = get_string(json, "type");
    device.meter_type = type ? external_device_type_from_string(*type) : ExternalDeviceType::UNKNOWN;
    device.value = get_double(json, "value");
    device.unit = get_string(json, "unit");
    device.timestamp = get_timestamp(json, "timestamp");
    return device;
}

MeteredData decode_metered_data(const nlohmann::json &json) {
    MeteredData data;

    for (const auto &field : kStringFields) {
        data.*field.member = get_string(json, field.key);
    }
    for (const auto &field : kDoubleFields) {
        data.*field.member = get_double(json, field.key);
    }
    for (const auto &field : kIntFields) {
        data.*field.member = get_int(json, field.key);
    }
    for (const auto &field : kTimestampFields) {
        data.*field.member = get_timestamp(json, field.key);
    }

    const nlohmann::json *external = find_field(json, "external");
    if (external != nullptr && external->is_array()) {
        data.external_devices.reserve(external->size());
        for (const auto &entry : *external) {
            if (entry.is_object()) {
                data.external_devices.push_back(decode_external_device(entry));
            }
        }
    }

    return data;
}

SwitchState decode_switch_state(const nlohmann::json &json) {
    SwitchState state;
    state.power_on = get_bool(json, "power_on");
    state.switch_lock = get_bool(json, "switch_lock");
    state.brightness = get_int(json, "brightness");
    return state;
}

SystemSettings decode_system_settings(const nlohmann::json &json) {
    SystemSettings settings;
    settings.cloud_enabled = get_bool(json, "cloud_enabled");
    return settings;
}

DecryptionStatus decode_decryption_status(const nlohmann::json &json) {
    DecryptionStatus status;
    status.key_set = get_bool(json, "key");
    status.aad_set = get_bool(json, "aad");
    return status;
}

nlohmann::json encode_device(const Device &device) {
    nlohmann::json out = nlohmann::json::object();
    put(out, "product_name", device.product_name);
    put(out, "product_type", device.product_type);
    put(out, "serial", device.serial);
    put(out, "api_version", device.api_version);
    put(out, "firmware_version", device.firmware_version);
    return out;
}

nlohmann::json encode_external_device(const ExternalDevice &device) {
    nlohmann::json out = nlohmann::json::object();
    put(out, "unique_id", device.unique_id);
    out["type"] = external_device_type_to_string(device.meter_type);
    put(out, "value", device.value);
    put(out, "unit", device.unit);
    put(out, "timestamp", device.timestamp);
    return out;
}

nlohmann::json encode_metered_data(const MeteredData &data) {
    nlohmann::json out = nlohmann::json::object();

    for (const auto &field : kStringFields) {
        put(out, field.key, data.*field.member);
    }
    for (const auto &field : kDoubleFields) {
        put(out, field.key, data.*field.member);
    }
    for (const auto &field : kIntFields) {
        put(out, field.key, data.*field.member);
    }
    for (const auto &field : kTimestampFields) {
        put(out, field.key, data.*field.member);
    }

    nlohmann::json external = nlohmann::json::array();
    for (const auto &device : data.external_devices) {
        external.push_back(encode_external_device(device));
    }
    out["external"] = std::move(external);

    return out;
}

nlohmann::json encode_switch_state(const SwitchState &state) {
    nlohmann::json out = nlohmann::json::object();
    put(out, "power_on", state.power_on);
    put(out, "switch_lock", state.switch_lock);
    put(out, "brightness", state.brightness);
    return out;
}

nlohmann::json encode_system_settings(const SystemSettings &settings) {
    nlohmann::json out = nlohmann::json::object();
    put(out, "cloud_enabled", settings.cloud_enabled);
    return out;
}

nlohmann::json encode_decryption_status(const DecryptionStatus &status) {
    nlohmann::json out = nlohmann::json::object();
    put(out, "key", status.key_set);
    put(out, "aad", status.aad_set);
    return out;
}

}  // namespace model
}  // namespace hwenergy
