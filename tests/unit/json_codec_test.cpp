/**
 * json_codec_test.cpp - Device payload decoding
 *
 * Tests:
 * 1. Device identity decoding
 * 2. Metered data from real P1 / socket / water meter payloads
 * 3. Lenient handling of nulls, wrong types and unknown keys
 * 4. External meter list and type mapping
 * 5. State, system and decryption records
 * 6. Encoding back to wire keys
 */

#include "model/json_codec.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace hwenergy::model;
using nlohmann::json;

// ============================================================================
// Device
// ============================================================================

TEST(DecodeDeviceTest, AllFields) {
    auto device = decode_device(json::parse(R"({
        "product_name": "P1 Meter",
        "product_type": "HWE-P1",
        "serial": "3c39e7aabbcc",
        "firmware_version": "4.19",
        "api_version": "v1"
    })"));

    EXPECT_EQ(device.product_name, "P1 Meter");
    EXPECT_EQ(device.product_type, "HWE-P1");
    EXPECT_EQ(device.serial, "3c39e7aabbcc");
    EXPECT_EQ(device.firmware_version, "4.19");
    EXPECT_EQ(device.api_version, "v1");
}

TEST(DecodeDeviceTest, MissingAndMistypedFieldsAreAbsent) {
    auto device = decode_device(json::parse(R"({"product_type": 12, "serial": null, "extra": "ignored"})"));
    EXPECT_FALSE(device.product_type.has_value());
    EXPECT_FALSE(device.serial.has_value());
    EXPECT_FALSE(device.product_name.has_value());
}

TEST(DecodeDeviceTest, NonObjectPayloadDecodesEmpty) {
    auto device = decode_device(json::array({1, 2, 3}));
    EXPECT_FALSE(device.product_type.has_value());
    EXPECT_FALSE(device.api_version.has_value());
}

// ============================================================================
// Metered data
// ============================================================================

TEST(DecodeMeteredDataTest, P1MeterPayload) {
    auto data = decode_metered_data(json::parse(R"({
        "wifi_ssid": "My Wi-Fi",
        "wifi_strength": 100,
        "smr_version": 50,
        "meter_model": "ISKRA  2M550T-101",
        "unique_id": "00112233445566778899AABBCCDDEEFF",
        "active_tariff": 2,
        "total_power_import_kwh": 13779.338,
        "total_power_import_t1_kwh": 10830.511,
        "total_power_import_t2_kwh": 2948.827,
        "total_power_export_kwh": 0,
        "active_power_w": -543,
        "active_power_l1_w": -676,
        "active_voltage_l1_v": 235.4,
        "active_current_l1_a": -4.703,
        "voltage_sag_l1_count": 1,
        "voltage_swell_l1_count": 0,
        "any_power_fail_count": 4,
        "long_power_fail_count": 5,
        "active_power_average_w": 123.0,
        "montly_power_peak_w": 1111.0,
        "montly_power_peak_timestamp": 230101080010,
        "total_gas_m3": 1122.333,
        "gas_timestamp": "210314112233",
        "gas_unique_id": "01FFEEDDCCBBAA99887766554433221100"
    })"));

    EXPECT_EQ(data.wifi_ssid, "My Wi-Fi");
    EXPECT_DOUBLE_EQ(data.wifi_strength.value(), 100.0);
    EXPECT_EQ(data.smr_version, 50);
    EXPECT_EQ(data.meter_model, "ISKRA  2M550T-101");
    EXPECT_EQ(data.unique_meter_id, "00112233445566778899AABBCCDDEEFF");
    EXPECT_EQ(data.active_tariff, 2);
    EXPECT_DOUBLE_EQ(data.total_power_import_kwh.value(), 13779.338);
    EXPECT_DOUBLE_EQ(data.total_power_import_t2_kwh.value(), 2948.827);
    EXPECT_FALSE(data.total_power_import_t3_kwh.has_value());
    EXPECT_DOUBLE_EQ(data.total_power_export_kwh.value(), 0.0);
    EXPECT_DOUBLE_EQ(data.active_power_w.value(), -543.0);
    EXPECT_DOUBLE_EQ(data.active_current_l1_a.value(), -4.703);
    EXPECT_EQ(data.voltage_sag_l1_count, 1);
    EXPECT_EQ(data.voltage_swell_l1_count, 0);
    EXPECT_EQ(data.any_power_fail_count, 4);
    EXPECT_EQ(data.long_power_fail_count, 5);
    EXPECT_DOUBLE_EQ(data.monthly_power_peak_w.value(), 1111.0);

    ASSERT_TRUE(data.monthly_power_peak_timestamp.has_value());
    EXPECT_EQ(data.monthly_power_peak_timestamp->to_iso8601(), "2023-01-01T08:00:10");

    ASSERT_TRUE(data.gas_timestamp.has_value());
    EXPECT_EQ(data.gas_timestamp->to_iso8601(), "2021-03-14T11:22:33");
    EXPECT_EQ(data.gas_unique_id, "01FFEEDDCCBBAA99887766554433221100");

    EXPECT_FALSE(data.active_liter_lpm.has_value());
    EXPECT_TRUE(data.external_devices.empty());
}

TEST(DecodeMeteredDataTest, WaterMeterPayload) {
    auto data = decode_metered_data(json::parse(R"({
        "wifi_ssid": "My Wi-Fi",
        "wifi_strength": 84,
        "total_liter_m3": 123.456,
        "active_liter_lpm": 7.2
    })"));

    EXPECT_DOUBLE_EQ(data.total_liter_m3.value(), 123.456);
    EXPECT_DOUBLE_EQ(data.active_liter_lpm.value(), 7.2);
    EXPECT_FALSE(data.total_power_import_kwh.has_value());
    EXPECT_FALSE(data.smr_version.has_value());
}

TEST(DecodeMeteredDataTest, IntegralFloatCountersAreAccepted) {
    auto data = decode_metered_data(json::parse(R"({"any_power_fail_count": 12.0, "long_power_fail_count": 1.5})"));
    EXPECT_EQ(data.any_power_fail_count, 12);
    EXPECT_FALSE(data.long_power_fail_count.has_value());
}

TEST(DecodeMeteredDataTest, WrongTypesDecodeAsAbsent) {
    auto data = decode_metered_data(json::parse(R"({
        "wifi_strength": "strong",
        "active_power_w": null,
        "smr_version": "50",
        "gas_timestamp": "not-a-time",
        "wifi_ssid": 5
    })"));

    EXPECT_FALSE(data.wifi_strength.has_value());
    EXPECT_FALSE(data.active_power_w.has_value());
    EXPECT_FALSE(data.smr_version.has_value());
    EXPECT_FALSE(data.gas_timestamp.has_value());
    EXPECT_FALSE(data.wifi_ssid.has_value());
}

TEST(DecodeMeteredDataTest, EmptyObject) {
    auto data = decode_metered_data(json::object());
    EXPECT_FALSE(data.active_power_w.has_value());
    EXPECT_TRUE(data.external_devices.empty());
}

// ============================================================================
// External meters
// ============================================================================

TEST(DecodeExternalDevicesTest, ListWithKnownAndUnknownTypes) {
    auto data = decode_metered_data(json::parse(R"({
        "external": [
            {"unique_id": "G001", "type": "gas_meter", "timestamp": 230125220957, "value": 111.111, "unit": "m3"},
            {"unique_id": "W001", "type": "water_meter", "timestamp": "230125220957", "value": 222.222, "unit": "m3"},
            {"unique_id": "X001", "type": "teleporter", "value": 1, "unit": "?"},
            "garbage",
            {"type": "heat_meter", "value": null}
        ]
    })"));

    ASSERT_EQ(data.external_devices.size(), 4u);

    const auto &gas = data.external_devices[0];
    EXPECT_EQ(gas.unique_id, "G001");
    EXPECT_EQ(gas.meter_type, ExternalDeviceType::GAS_METER);
    EXPECT_DOUBLE_EQ(gas.value.value(), 111.111);
    EXPECT_EQ(gas.unit, "m3");
    ASSERT_TRUE(gas.timestamp.has_value());
    EXPECT_EQ(gas.timestamp->to_iso8601(), "2023-01-25T22:09:57");

    EXPECT_EQ(data.external_devices[1].meter_type, ExternalDeviceType::WATER_METER);
    EXPECT_EQ(data.external_devices[1].timestamp, gas.timestamp);

    EXPECT_EQ(data.external_devices[2].meter_type, ExternalDeviceType::UNKNOWN);

    EXPECT_EQ(data.external_devices[3].meter_type, ExternalDeviceType::HEAT_METER);
    EXPECT_FALSE(data.external_devices[3].unique_id.has_value());
    EXPECT_FALSE(data.external_devices[3].value.has_value());
}

TEST(DecodeExternalDevicesTest, NonArrayExternalIsIgnored) {
    auto data = decode_metered_data(json::parse(R"({"external": {"type": "gas_meter"}})"));
    EXPECT_TRUE(data.external_devices.empty());
}

TEST(ExternalDeviceTypeTest, MappingIsTotal) {
    EXPECT_EQ(external_device_type_from_string("gas_meter"), ExternalDeviceType::GAS_METER);
    EXPECT_EQ(external_device_type_from_string("heat_meter"), ExternalDeviceType::HEAT_METER);
    EXPECT_EQ(external_device_type_from_string("warm_water_meter"), ExternalDeviceType::WARM_WATER_METER);
    EXPECT_EQ(external_device_type_from_string("water_meter"), ExternalDeviceType::WATER_METER);
    EXPECT_EQ(external_device_type_from_string("inlet_heat_meter"), ExternalDeviceType::INLET_HEAT_METER);
    EXPECT_EQ(external_device_type_from_string(""), ExternalDeviceType::UNKNOWN);
    EXPECT_EQ(external_device_type_from_string("GAS_METER"), ExternalDeviceType::UNKNOWN);
}

TEST(ExternalDeviceTypeTest, OmsValues) {
    EXPECT_EQ(static_cast<int>(ExternalDeviceType::GAS_METER), 3);
    EXPECT_EQ(static_cast<int>(ExternalDeviceType::HEAT_METER), 4);
    EXPECT_EQ(static_cast<int>(ExternalDeviceType::WARM_WATER_METER), 6);
    EXPECT_EQ(static_cast<int>(ExternalDeviceType::WATER_METER), 7);
    EXPECT_EQ(static_cast<int>(ExternalDeviceType::INLET_HEAT_METER), 12);
}

// ============================================================================
// State, system, decryption
// ============================================================================

TEST(DecodeSwitchStateTest, AllFields) {
    auto state = decode_switch_state(json::parse(R"({"power_on": true, "switch_lock": false, "brightness": 255})"));
    EXPECT_EQ(state.power_on, true);
    EXPECT_EQ(state.switch_lock, false);
    EXPECT_EQ(state.brightness, 255);
}

TEST(DecodeSwitchStateTest, NumericBooleanIsAbsent) {
    auto state = decode_switch_state(json::parse(R"({"power_on": 1})"));
    EXPECT_FALSE(state.power_on.has_value());
}

TEST(DecodeSystemSettingsTest, CloudEnabled) {
    EXPECT_EQ(decode_system_settings(json::parse(R"({"cloud_enabled": false})")).cloud_enabled, false);
    EXPECT_FALSE(decode_system_settings(json::object()).cloud_enabled.has_value());
}

TEST(DecodeDecryptionStatusTest, KeyAndAadFlags) {
    auto status = decode_decryption_status(json::parse(R"({"key": true, "aad": false})"));
    EXPECT_EQ(status.key_set, true);
    EXPECT_EQ(status.aad_set, false);
}

// ============================================================================
// Encoding
// ============================================================================

TEST(EncodeTest, MeteredDataUsesWireKeysAndIsoTimestamps) {
    MeteredData data;
    data.unique_meter_id = "ABC";
    data.monthly_power_peak_w = 1111.0;
    data.monthly_power_peak_timestamp = parse_compact_timestamp(std::string("230101080010"));

    auto out = encode_metered_data(data);
    EXPECT_EQ(out["unique_id"], "ABC");
    EXPECT_EQ(out["montly_power_peak_w"], 1111.0);
    EXPECT_EQ(out["montly_power_peak_timestamp"], "2023-01-01T08:00:10");
    EXPECT_FALSE(out.contains("active_power_w"));
    EXPECT_TRUE(out["external"].is_array());
}

TEST(EncodeTest, SwitchStateOmitsAbsentFields) {
    SwitchState state;
    state.power_on = true;
    auto out = encode_switch_state(state);
    EXPECT_EQ(out, json::parse(R"({"power_on": true})"));
}

TEST(EncodeTest, DecodedDeviceReencodesToSameObject) {
    auto payload = json::parse(
        R"({"product_name": "Energy Socket", "product_type": "HWE-SKT", "serial": "x", "firmware_version": "3.03",
            "api_version": "v1"})");
    EXPECT_EQ(encode_device(decode_device(payload)), payload);
}
