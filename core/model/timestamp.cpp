#include "timestamp.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace hwenergy {
namespace model {

namespace {

bool is_leap_year(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's days_from_civil)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int two_digits(const std::string &text, size_t pos) { return (text[pos] - '0') * 10 + (text[pos + 1] - '0'); }

}  // namespace

std::chrono::system_clock::time_point Timestamp::to_time_point() const {
    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

std::string Timestamp::to_iso8601() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-" << std::setw(2) << day
        << "T" << std::setw(2) << hour << ":" << std::setw(2) << minute << ":" << std::setw(2) << second;
    return oss.str();
}

bool Timestamp::operator==(const Timestamp &other) const {
    return year == other.year && month == other.month && day == other.day && hour == other.hour &&
           minute == other.minute && second == other.second;
}

std::optional<Timestamp> parse_compact_timestamp(const std::string &text) {
    if (text.size() != 12) {
        return std::nullopt;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }

    Timestamp ts;
    int yy = two_digits(text, 0);
    ts.year = yy < 69 ? 2000 + yy : 1900 + yy;
    ts.month = two_digits(text, 2);
    ts.day = two_digits(text, 4);
    ts.hour = two_digits(text, 6);
    ts.minute = two_digits(text, 8);
    ts.second = two_digits(text, 10);

    if (ts.month < 1 || ts.month > 12) return std::nullopt;
    if (ts.day < 1 || ts.day > days_in_month(ts.year, ts.month)) return std::nullopt;
    if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) return std::nullopt;

    return ts;
}

std::optional<Timestamp> parse_compact_timestamp(const nlohmann::json &value) {
    if (value.is_string()) {
        return parse_compact_timestamp(value.get<std::string>());
    }
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0)) {
        // Integers drop leading zeros, so 2000-2009 dates only decode from strings
        return parse_compact_timestamp(std::to_string(value.get<uint64_t>()));
    }
    return std::nullopt;
}

std::string format_compact_timestamp(const Timestamp &ts) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << (ts.year % 100) << std::setw(2) << ts.month << std::setw(2) << ts.day
        << std::setw(2) << ts.hour << std::setw(2) << ts.minute << std::setw(2) << ts.second;
    return oss.str();
}

}  // namespace model
}  // namespace hwenergy
