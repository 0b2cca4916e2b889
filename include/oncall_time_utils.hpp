/**
 * @file oncall_time_utils.hpp
 * @brief UTC timestamp utilities for the rotation scheduler
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * This header provides:
 * - Strict parsing of YYYY-MM-DDTHH:MM:SSZ timestamps
 * - Exact round-trip formatting of the same representation
 * - Day arithmetic on time points
 *
 * Conversions never consult the local timezone.
 */

#ifndef ONCALL_TIME_UTILS_HPP
#define ONCALL_TIME_UTILS_HPP

#include "result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <iomanip>
#include <sstream>

namespace oncall {
namespace time_utils {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using Seconds = std::chrono::seconds;
// Whole seconds since the Unix epoch; the int64 count spans every
// four-digit year, unlike the nanosecond system_clock::time_point.
using TimePoint = std::chrono::time_point<Clock, Seconds>;
using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

inline constexpr std::size_t kTimestampLength = 20;  // "2023-01-01T00:00:00Z"

// ============================================================================
// Civil Calendar Arithmetic
// ============================================================================

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 * @param y Year
 * @param m Month (1-12)
 * @param d Day (1-31)
 */
[[nodiscard]] constexpr int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

/**
 * @brief Inverse of daysFromCivil
 */
[[nodiscard]] constexpr CivilDate civilFromDays(int64_t z) noexcept {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
    return CivilDate{y, m, d};
}

[[nodiscard]] constexpr bool isLeapYear(int64_t y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

[[nodiscard]] constexpr unsigned daysInMonth(int64_t y, unsigned m) noexcept {
    constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeapYear(y)) ? 29u : kDays[m - 1];
}

// ============================================================================
// Construction
// ============================================================================

/**
 * @brief Create a UTC time point from date components
 */
[[nodiscard]] inline TimePoint fromComponents(int year, int month, int day,
                                              int hour = 0, int minute = 0,
                                              int second = 0) noexcept {
    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                                       static_cast<unsigned>(day));
    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    return TimePoint(Seconds(secs));
}

[[nodiscard]] inline int64_t toUnixSeconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().count();
}

[[nodiscard]] inline TimePoint fromUnixSeconds(int64_t secs) noexcept {
    return TimePoint(Seconds(secs));
}

[[nodiscard]] inline TimePoint addDays(TimePoint tp, int64_t days) noexcept {
    return tp + std::chrono::duration_cast<Seconds>(Days(days));
}

// ============================================================================
// Parsing
// ============================================================================

namespace detail {

inline bool readDigits(std::string_view s, std::size_t pos, std::size_t count, int& out) {
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // namespace detail

/**
 * @brief Parse a timestamp of the exact form YYYY-MM-DDTHH:MM:SSZ
 * @param text Timestamp text
 * @return Time point, or MALFORMED_TIMESTAMP
 */
[[nodiscard]] inline Result<TimePoint> parseTimestamp(std::string_view text) {
    auto malformed = [&text](const std::string& why) {
        return Err<TimePoint>(Error{ErrorCode::MALFORMED_TIMESTAMP,
                                    "Malformed timestamp '" + std::string(text) + "': " + why});
    };

    if (text.size() != kTimestampLength) {
        return malformed("expected YYYY-MM-DDTHH:MM:SSZ");
    }
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':' || text[19] != 'Z') {
        return malformed("bad separator");
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!detail::readDigits(text, 0, 4, year) || !detail::readDigits(text, 5, 2, month) ||
        !detail::readDigits(text, 8, 2, day) || !detail::readDigits(text, 11, 2, hour) ||
        !detail::readDigits(text, 14, 2, minute) || !detail::readDigits(text, 17, 2, second)) {
        return malformed("non-digit in numeric field");
    }

    if (month < 1 || month > 12) return malformed("month out of range");
    if (day < 1 || static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month))) {
        return malformed("day out of range");
    }
    if (hour > 23) return malformed("hour out of range");
    if (minute > 59) return malformed("minute out of range");
    if (second > 59) return malformed("second out of range");

    return fromComponents(year, month, day, hour, minute, second);
}

[[nodiscard]] inline bool isTimestamp(std::string_view text) {
    return parseTimestamp(text).isOk();
}

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Format time point as YYYY-MM-DDTHH:MM:SSZ (UTC)
 */
[[nodiscard]] inline std::string formatTimestamp(TimePoint tp) {
    const int64_t secs = tp.time_since_epoch().count();
    int64_t days = secs / 86400;
    int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    const CivilDate date = civilFromDays(days);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day << 'T'
        << std::setw(2) << rem / 3600 << ':'
        << std::setw(2) << (rem % 3600) / 60 << ':'
        << std::setw(2) << rem % 60 << 'Z';
    return oss.str();
}

} // namespace time_utils
} // namespace oncall

#endif // ONCALL_TIME_UTILS_HPP
