#pragma once

/**
 * Time utilities for the simulator
 *
 * Market and trade timestamps are milliseconds since the Unix epoch (UTC).
 * Formatting is always UTC.
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace intraday {
namespace util {

/**
 * Returns current wall-clock time in milliseconds since Unix epoch.
 */
inline Timestamp wall_clock_ms() {
    auto now = std::chrono::system_clock::now();
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

/**
 * Build a UTC timestamp (ms) from calendar fields.
 */
inline Timestamp make_utc_timestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return static_cast<Timestamp>(timegm(&tm)) * MS_PER_SECOND;
}

inline std::string format_utc(Timestamp ts, const char* pattern) {
    time_t t = static_cast<time_t>(ts / MS_PER_SECOND);
    struct tm tm;
    gmtime_r(&t, &tm);
    char buf[40];
    strftime(buf, sizeof(buf), pattern, &tm);
    return buf;
}

// "2025-03-19 14:30:00"
inline std::string format_timestamp(Timestamp ts) { return format_utc(ts, "%Y-%m-%d %H:%M:%S"); }

// "2025-03-19T14:30:00Z"
inline std::string format_iso8601(Timestamp ts) { return format_utc(ts, "%Y-%m-%dT%H:%M:%SZ"); }

// "2025-03-19_14-30-00", safe in file names
inline std::string format_file_stamp(Timestamp ts) { return format_utc(ts, "%Y-%m-%d_%H-%M-%S"); }

} // namespace util
} // namespace intraday
