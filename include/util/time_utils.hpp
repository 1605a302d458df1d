#pragma once

/**
 * Date utilities for daily bars.
 *
 * Bars are stamped at 00:00 UTC of their session date, in milliseconds
 * since the Unix epoch. Conversion uses the civil-from-days algorithm so
 * it is independent of the process time zone.
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace quantcode {
namespace util {

// Days since 1970-01-01 for a proleptic Gregorian date
constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * Parse "YYYY-MM-DD" (anything after the date, e.g. a time part, is ignored).
 * Returns std::nullopt when the date is malformed or out of range.
 */
inline std::optional<Timestamp> parse_date(const std::string& s) {
    int y = 0, m = 0, d = 0;
    if (s.size() < 10 || std::sscanf(s.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3)
        return std::nullopt;
    if (y < 1970 || m < 1 || m > 12 || d < 1 || d > 31)
        return std::nullopt;
    int64_t days = days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    return static_cast<Timestamp>(days) * MS_PER_DAY;
}

/**
 * Format a timestamp as "YYYY-MM-DD" (UTC).
 */
inline std::string format_date(Timestamp ts) {
    int64_t z = static_cast<int64_t>(ts / MS_PER_DAY) + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
    return buf;
}

/**
 * Current wall-clock time in milliseconds since Unix epoch.
 */
inline Timestamp wall_clock_ms() {
    auto now = std::chrono::system_clock::now();
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

} // namespace util
} // namespace quantcode
