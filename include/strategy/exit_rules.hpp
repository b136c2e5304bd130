#pragma once

#include "../market/price_bar.hpp"
#include "../types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace intraday {
namespace strategy {

/**
 * Why a position was closed. Attached to every SELL, never to a BUY.
 */
enum class ExitReason : uint8_t { StopLoss = 0, TakeProfit = 1, TimeExit = 2, ManualStop = 3 };

constexpr size_t EXIT_REASON_COUNT = 4;

inline const char* exit_reason_to_string(ExitReason reason) {
    switch (reason) {
    case ExitReason::StopLoss:
        return "Stop Loss";
    case ExitReason::TakeProfit:
        return "Take Profit";
    case ExitReason::TimeExit:
        return "Time Exit";
    case ExitReason::ManualStop:
        return "Manual Stop";
    }
    return "Unknown";
}

/**
 * Exit parameters in fixed-point form
 *
 * stop_loss / take_profit are fractions of the entry price in ppm
 * (1000 = 0.1%). max_hold_ms is measured on tick timestamps.
 */
struct ExitRules {
    Rate stop_loss = 1000;
    Rate take_profit = 2000;
    DurationMs max_hold_ms = 5 * MS_PER_MINUTE;
};

/**
 * Price thresholds for one open position
 *
 * Comparisons are inclusive and exact: the price is cross-multiplied
 * against entry * (1 -/+ rate) in 128-bit, so a tick sitting exactly on
 * a threshold always triggers.
 */
struct ExitThresholds {
    Price entry = 0;
    Rate stop_loss = 0;
    Rate take_profit = 0;

    bool stop_loss_hit(Price price) const {
        return static_cast<WidePrice>(price) * RATE_SCALE <=
               static_cast<WidePrice>(entry) * (RATE_SCALE - stop_loss);
    }

    bool take_profit_hit(Price price) const {
        return static_cast<WidePrice>(price) * RATE_SCALE >=
               static_cast<WidePrice>(entry) * (RATE_SCALE + take_profit);
    }

    // Display values (truncated to PRICE_SCALE resolution)
    Price stop_loss_price() const {
        return static_cast<Price>(static_cast<WidePrice>(entry) * (RATE_SCALE - stop_loss) / RATE_SCALE);
    }

    Price take_profit_price() const {
        return static_cast<Price>(static_cast<WidePrice>(entry) * (RATE_SCALE + take_profit) / RATE_SCALE);
    }
};

inline bool hold_expired(Timestamp entry_time, Timestamp now, DurationMs max_hold_ms) {
    return now >= entry_time && now - entry_time >= max_hold_ms;
}

/**
 * Evaluate the exit rules against a tick, in priority order:
 * stop-loss, take-profit, time exit. First match wins.
 */
inline std::optional<ExitReason> check_exit(const ExitThresholds& thresholds, Timestamp entry_time,
                                            DurationMs max_hold_ms, const market::PriceTick& tick) {
    if (thresholds.stop_loss_hit(tick.close_price)) {
        return ExitReason::StopLoss;
    }
    if (thresholds.take_profit_hit(tick.close_price)) {
        return ExitReason::TakeProfit;
    }
    if (hold_expired(entry_time, tick.timestamp, max_hold_ms)) {
        return ExitReason::TimeExit;
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace intraday
