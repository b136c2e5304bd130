#pragma once

#include "../types.hpp"
#include "exit_rules.hpp"

#include <cstdint>
#include <optional>

namespace intraday {
namespace strategy {

enum class TradeKind : uint8_t { Buy = 0, Sell = 1 };

inline const char* trade_kind_to_string(TradeKind kind) {
    switch (kind) {
    case TradeKind::Buy:
        return "BUY";
    case TradeKind::Sell:
        return "SELL";
    }
    return "?";
}

/**
 * Trade Event
 *
 * Emitted by the position state machine on every open (BUY) and close
 * (SELL). profit and reason are set on SELL only; profit is the price
 * difference sell - entry, not a percentage.
 */
struct TradeEvent {
    TradeKind kind = TradeKind::Buy;
    Price price = 0;
    Timestamp timestamp = 0;
    std::optional<Price> profit;
    std::optional<ExitReason> reason;

    static TradeEvent buy(Price price, Timestamp ts) { return TradeEvent{TradeKind::Buy, price, ts, {}, {}}; }

    static TradeEvent sell(Price price, Timestamp ts, Price profit, ExitReason reason) {
        return TradeEvent{TradeKind::Sell, price, ts, profit, reason};
    }

    bool is_buy() const { return kind == TradeKind::Buy; }
    bool is_sell() const { return kind == TradeKind::Sell; }
};

} // namespace strategy
} // namespace intraday
