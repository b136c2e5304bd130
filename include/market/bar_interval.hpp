#pragma once

#include "../types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace intraday {
namespace market {

/**
 * Bar cadence. Each interval maps 1:1 to the polling period.
 */
enum class BarInterval : uint8_t { OneMinute, FifteenMinutes };

inline const char* interval_to_string(BarInterval interval) {
    switch (interval) {
    case BarInterval::OneMinute:
        return "1m";
    case BarInterval::FifteenMinutes:
        return "15m";
    }
    return "?";
}

inline std::optional<BarInterval> interval_from_string(const std::string& s) {
    if (s == "1m") return BarInterval::OneMinute;
    if (s == "15m") return BarInterval::FifteenMinutes;
    return std::nullopt;
}

// 60s for 1m bars, 900s for 15m bars
inline DurationMs interval_period_ms(BarInterval interval) {
    switch (interval) {
    case BarInterval::OneMinute:
        return 1 * MS_PER_MINUTE;
    case BarInterval::FifteenMinutes:
        return 15 * MS_PER_MINUTE;
    }
    return 1 * MS_PER_MINUTE;
}

} // namespace market
} // namespace intraday
