#pragma once

#include "../market/price_bar.hpp"
#include "../types.hpp"
#include "exit_rules.hpp"
#include "trade_event.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace intraday {
namespace strategy {

/**
 * Raised when a caller breaks the ordering contract (a tick or manual
 * close stamped before the open position's entry). Programmer error,
 * not an external-world condition: never retried.
 */
class StateInvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Open long position. At most one exists at a time.
 */
struct OpenPosition {
    Price entry_price = 0;
    Timestamp entry_time = 0;
};

/**
 * Position State Machine
 *
 * States:
 *   Flat  - no position
 *   Long  - one open position
 *
 * Transitions:
 *   Flat --tick--> Long              BUY at tick close (unconditional entry)
 *   Long --tick--> Flat              SELL when an exit rule fires
 *                                    (stop-loss, take-profit, time exit)
 *   Long --tick--> Long              no event
 *   Long --close_manually--> Flat    SELL with ManualStop
 *   Flat --close_manually--> Flat    no event
 *
 * All time comparisons use tick timestamps, so a recorded tick sequence
 * replays identically. Each instance owns its position; independent
 * simulations just use independent instances.
 *
 * Usage:
 *   PositionStateMachine machine(config.exit_rules());
 *   if (auto event = machine.evaluate(tick)) sink.on_event(*event);
 */
class PositionStateMachine {
public:
    explicit PositionStateMachine(const ExitRules& rules) : rules_(rules) {}

    /**
     * Process one tick. Mutates state at most once.
     *
     * @return BUY when flat, SELL when an exit rule fires, nothing otherwise
     * @throws StateInvariantViolation if the tick predates the entry
     */
    std::optional<TradeEvent> evaluate(const market::PriceTick& tick) {
        if (!position_) {
            return open(tick);
        }

        if (tick.timestamp < position_->entry_time) {
            throw StateInvariantViolation("Tick at " + std::to_string(tick.timestamp) +
                                          " predates position entry at " +
                                          std::to_string(position_->entry_time));
        }

        auto reason = check_exit(*thresholds(), position_->entry_time, rules_.max_hold_ms, tick);
        if (!reason) {
            return std::nullopt;
        }
        return close(tick.close_price, tick.timestamp, *reason);
    }

    /**
     * Close the open position at a caller-supplied price/time (manual stop).
     * No-op when flat, so repeated calls emit at most one SELL.
     */
    std::optional<TradeEvent> close_manually(Price price, Timestamp timestamp) {
        if (!position_) {
            return std::nullopt;
        }

        if (timestamp < position_->entry_time) {
            throw StateInvariantViolation("Manual close at " + std::to_string(timestamp) +
                                          " predates position entry at " +
                                          std::to_string(position_->entry_time));
        }

        return close(price, timestamp, ExitReason::ManualStop);
    }

    bool is_flat() const { return !position_.has_value(); }
    bool is_long() const { return position_.has_value(); }

    const std::optional<OpenPosition>& position() const { return position_; }

    std::optional<ExitThresholds> thresholds() const {
        if (!position_) return std::nullopt;
        return ExitThresholds{position_->entry_price, rules_.stop_loss, rules_.take_profit};
    }

    // "None" or "LONG", as shown in status lines
    const char* position_label() const { return position_ ? "LONG" : "None"; }

    uint64_t completed_trades() const { return completed_trades_; }
    Price realized_profit() const { return realized_profit_; }
    const ExitRules& rules() const { return rules_; }

private:
    ExitRules rules_;
    std::optional<OpenPosition> position_;
    uint64_t completed_trades_ = 0;
    Price realized_profit_ = 0;

    TradeEvent open(const market::PriceTick& tick) {
        position_ = OpenPosition{tick.close_price, tick.timestamp};
        return TradeEvent::buy(tick.close_price, tick.timestamp);
    }

    TradeEvent close(Price price, Timestamp timestamp, ExitReason reason) {
        Price profit = price - position_->entry_price;
        position_.reset();
        ++completed_trades_;
        realized_profit_ += profit;
        return TradeEvent::sell(price, timestamp, profit, reason);
    }
};

} // namespace strategy
} // namespace intraday
