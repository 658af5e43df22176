#ifndef HWENERGY_MODEL_TIMESTAMP_HPP
#define HWENERGY_MODEL_TIMESTAMP_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hwenergy {
namespace model {

// Calendar timestamp as reported by the meter (device local time, no zone)
struct Timestamp {
    int year = 2000;
    int month = 1;  // 1-12
    int day = 1;    // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;

    // Seconds since 1970-01-01T00:00:00, treating the fields as UTC
    std::chrono::system_clock::time_point to_time_point() const;

    // "YYYY-MM-DDTHH:MM:SS"
    std::string to_iso8601() const;

    bool operator==(const Timestamp &other) const;
    bool operator!=(const Timestamp &other) const { return !(*this == other); }
};

/**
 * @brief Decode a compact "yyMMddHHmmss" timestamp
 *
 * Requires exactly 12 digits describing a valid calendar date and time.
 * Two-digit years 00-68 map to 20yy, 69-99 to 19yy.
 *
 * @return std::nullopt on any malformed input
 */
std::optional<Timestamp> parse_compact_timestamp(const std::string &text);

/**
 * @brief Decode a compact timestamp from a JSON value
 *
 * The device sends these either as string or as unsigned integer.
 * Anything else (null, negative, float, wrong length) decodes as absent.
 */
std::optional<Timestamp> parse_compact_timestamp(const nlohmann::json &value);

// Inverse of parse_compact_timestamp
std::string format_compact_timestamp(const Timestamp &ts);

}  // namespace model
}  // namespace hwenergy

#endif  // HWENERGY_MODEL_TIMESTAMP_HPP
