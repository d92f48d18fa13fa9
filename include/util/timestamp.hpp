#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace gp::util {

namespace detail {

inline bool readDigits(const std::string& s, const std::size_t pos, const std::size_t n, int& out) {
    if (pos + n > s.size()) return false;
    out = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

inline bool isLeapYear(const int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int daysInMonth(const int year, const int month) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

}

// e.g. 2024-03-07T14:30:00.123456 (UTC, no zone suffix)
inline std::string utcNowIso() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&now_c, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

/**
 * Parses an ISO-8601 date or date-time into its wall-clock fields.
 *
 * Accepts YYYY-MM-DD, optionally followed by 'T' or ' ' and HH:MM[:SS[.ffffff]],
 * optionally followed by 'Z' or a +HH:MM / -HH:MM offset. The offset is validated
 * but not applied. Returns nullopt for anything else, including out-of-range fields.
 */
inline std::optional<std::tm> parseIsoTimestamp(const std::string& iso) {
    using detail::readDigits;

    int year = 0, month = 0, day = 0;
    if (iso.size() < 10 || !readDigits(iso, 0, 4, year) || iso[4] != '-' || !readDigits(iso, 5, 2, month)
        || iso[7] != '-' || !readDigits(iso, 8, 2, day))
        return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    std::size_t pos = 10;

    if (pos < iso.size() && (iso[pos] == 'T' || iso[pos] == ' ')) {
        if (!readDigits(iso, pos + 1, 2, hour) || pos + 3 >= iso.size() || iso[pos + 3] != ':'
            || !readDigits(iso, pos + 4, 2, minute))
            return std::nullopt;
        pos += 6;

        if (pos < iso.size() && iso[pos] == ':') {
            if (!readDigits(iso, pos + 1, 2, second)) return std::nullopt;
            pos += 3;

            if (pos < iso.size() && iso[pos] == '.') {
                std::size_t digits = 0;
                for (++pos; pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos])); ++pos) ++digits;
                if (digits == 0 || digits > 6) return std::nullopt;
            }
        }
    }

    if (pos < iso.size()) {
        if (iso[pos] == 'Z') ++pos;
        else if (iso[pos] == '+' || iso[pos] == '-') {
            int offHours = 0, offMinutes = 0;
            if (!readDigits(iso, pos + 1, 2, offHours) || pos + 3 >= iso.size() || iso[pos + 3] != ':'
                || !readDigits(iso, pos + 4, 2, offMinutes) || offHours > 23 || offMinutes > 59)
                return std::nullopt;
            pos += 6;
        }
    }

    if (pos != iso.size()) return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > detail::daysInMonth(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = 0;
    return tm;
}

} // namespace gp::util
