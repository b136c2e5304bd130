#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace intraday {

// Fixed-point price: 6 decimal places (e.g., 2850250000 = 2850.25)
using Price = int64_t;
// Fraction in parts per million (e.g., 1000 = 0.1%)
using Rate = int64_t;
// Milliseconds since Unix epoch (UTC)
using Timestamp = uint64_t;
using DurationMs = uint64_t;

// Wide intermediate for price * rate products (no overflow, no rounding)
using WidePrice = __int128;

constexpr Price PRICE_SCALE = 1'000'000;
constexpr Rate RATE_SCALE = 1'000'000;

constexpr DurationMs MS_PER_SECOND = 1000;
constexpr DurationMs MS_PER_MINUTE = 60 * MS_PER_SECOND;

inline Price to_price(double value) {
    return static_cast<Price>(std::llround(value * static_cast<double>(PRICE_SCALE)));
}

// Decimal fraction (0.001 = 0.1%) to parts per million
inline Rate to_rate(double fraction) {
    return static_cast<Rate>(std::llround(fraction * static_cast<double>(RATE_SCALE)));
}

/**
 * Exact decimal rendering of a fixed-point price.
 *
 * Trailing zeros are trimmed down to min_decimals (2847.39975, -2.85, 100.00).
 */
inline std::string format_price(Price price, int min_decimals = 2) {
    std::string out;
    uint64_t magnitude;
    if (price < 0) {
        out.push_back('-');
        magnitude = static_cast<uint64_t>(-(price + 1)) + 1;
    } else {
        magnitude = static_cast<uint64_t>(price);
    }

    const uint64_t scale = static_cast<uint64_t>(PRICE_SCALE);
    out += std::to_string(magnitude / scale);

    std::string frac = std::to_string(magnitude % scale);
    frac.insert(0, 6 - frac.size(), '0');
    size_t keep = frac.size();
    while (keep > static_cast<size_t>(min_decimals) && frac[keep - 1] == '0') {
        --keep;
    }
    if (keep > 0) {
        out.push_back('.');
        out.append(frac, 0, keep);
    }
    return out;
}

} // namespace intraday
