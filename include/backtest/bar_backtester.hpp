#pragma once

#include "../market/price_bar.hpp"
#include "../sinks/trade_event_sink.hpp"
#include "../strategy/position_state_machine.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace intraday {
namespace backtest {

using strategy::ExitReason;
using strategy::TradeEvent;

/**
 * One BUY/SELL pair
 */
struct RoundTrip {
    Timestamp buy_time = 0;
    Price buy_price = 0;
    Timestamp sell_time = 0;
    Price sell_price = 0;
    ExitReason reason = ExitReason::ManualStop;
    Price profit = 0;

    DurationMs holding_ms() const { return sell_time - buy_time; }
};

/**
 * Backtest Summary
 */
struct BacktestSummary {
    uint64_t bars = 0;
    uint64_t total_trades = 0;
    uint64_t winning_trades = 0;
    uint64_t losing_trades = 0;
    Price total_profit = 0;
    Price largest_win = 0;
    Price largest_loss = 0; // most negative profit, 0 if none
    std::array<uint64_t, strategy::EXIT_REASON_COUNT> by_reason{};
    Timestamp start_time = 0;
    Timestamp end_time = 0;

    double win_rate() const {
        return total_trades > 0 ? static_cast<double>(winning_trades) / total_trades * 100.0 : 0.0;
    }

    uint64_t count(ExitReason reason) const { return by_reason[static_cast<size_t>(reason)]; }

    void print(std::ostream& out) const {
        out << "\n========================================\n"
            << "           BACKTEST SUMMARY\n"
            << "========================================\n"
            << "Period:          " << util::format_timestamp(start_time) << " - "
            << util::format_timestamp(end_time) << "\n"
            << "Bars:            " << bars << "\n"
            << "Total Trades:    " << total_trades << "\n"
            << "Total Profit:    " << format_price(total_profit) << "\n"
            << "Winning Trades:  " << winning_trades << "\n"
            << "Losing Trades:   " << losing_trades << "\n"
            << "Win Rate:        " << std::fixed << std::setprecision(1) << win_rate() << "%\n"
            << "Largest Win:     " << format_price(largest_win) << "\n"
            << "Largest Loss:    " << format_price(largest_loss) << "\n"
            << "----------------------------------------\n";
        for (size_t i = 0; i < strategy::EXIT_REASON_COUNT; ++i) {
            auto reason = static_cast<ExitReason>(i);
            out << std::left << std::setw(17) << (std::string(strategy::exit_reason_to_string(reason)) + ":")
                << std::right << by_reason[i] << "\n";
        }
        out << "========================================\n";
    }
};

/**
 * Bar Backtester
 *
 * Replays a bar sequence through a fresh PositionStateMachine, one tick
 * per bar close. Same exit rules as the live loop, no waiting. A position
 * still open after the last bar is closed with ManualStop at its close.
 *
 * Usage:
 *   BarBacktester backtester(config.exit_rules());
 *   auto summary = backtester.run(market::load_bars_csv("bars.csv"));
 *   summary.print(std::cout);
 */
class BarBacktester {
public:
    explicit BarBacktester(const strategy::ExitRules& rules) : rules_(rules) {}

    // Events are also forwarded to sink, if given (e.g. a CsvTradeLog)
    BacktestSummary run(std::vector<market::PriceBar> bars, sinks::ITradeEventSink* sink = nullptr) {
        events_.clear();
        round_trips_.clear();
        sink_ = sink;

        std::stable_sort(bars.begin(), bars.end(),
                         [](const market::PriceBar& a, const market::PriceBar& b) { return a.open_time < b.open_time; });

        strategy::PositionStateMachine machine(rules_);
        for (const auto& bar : bars) {
            if (auto event = machine.evaluate(bar.tick())) {
                record(*event);
            }
        }

        if (!bars.empty()) {
            const auto& last = bars.back();
            if (auto event = machine.close_manually(last.close, last.open_time)) {
                record(*event);
            }
        }

        if (sink_) {
            sink_->flush();
        }
        sink_ = nullptr;

        BacktestSummary summary = summarize();
        summary.bars = bars.size();
        if (!bars.empty()) {
            summary.start_time = bars.front().open_time;
            summary.end_time = bars.back().open_time;
        }
        return summary;
    }

    const std::vector<TradeEvent>& events() const { return events_; }
    const std::vector<RoundTrip>& round_trips() const { return round_trips_; }

    void print_round_trips(std::ostream& out) const {
        out << std::left << std::setw(21) << "Buy Time" << std::setw(12) << "Buy" << std::setw(21) << "Sell Time"
            << std::setw(12) << "Sell" << std::setw(12) << "Profit" << "Reason\n";
        for (const auto& trip : round_trips_) {
            out << std::left << std::setw(21) << util::format_timestamp(trip.buy_time) << std::setw(12)
                << format_price(trip.buy_price) << std::setw(21) << util::format_timestamp(trip.sell_time)
                << std::setw(12) << format_price(trip.sell_price) << std::setw(12) << format_price(trip.profit)
                << strategy::exit_reason_to_string(trip.reason) << "\n";
        }
        out << std::right;
    }

private:
    strategy::ExitRules rules_;
    std::vector<TradeEvent> events_;
    std::vector<RoundTrip> round_trips_;
    sinks::ITradeEventSink* sink_ = nullptr;

    void record(const TradeEvent& event) {
        events_.push_back(event);
        if (sink_) {
            sink_->on_event(event);
        }

        if (event.is_buy()) {
            RoundTrip trip;
            trip.buy_time = event.timestamp;
            trip.buy_price = event.price;
            round_trips_.push_back(trip);
            return;
        }

        // The state machine guarantees a SELL follows an open BUY
        auto& trip = round_trips_.back();
        trip.sell_time = event.timestamp;
        trip.sell_price = event.price;
        trip.profit = event.profit.value_or(0);
        trip.reason = event.reason.value_or(ExitReason::ManualStop);
    }

    BacktestSummary summarize() const {
        BacktestSummary summary;
        for (const auto& trip : round_trips_) {
            ++summary.total_trades;
            summary.total_profit += trip.profit;
            ++summary.by_reason[static_cast<size_t>(trip.reason)];

            if (trip.profit > 0) {
                ++summary.winning_trades;
                summary.largest_win = std::max(summary.largest_win, trip.profit);
            } else if (trip.profit < 0) {
                ++summary.losing_trades;
                summary.largest_loss = std::min(summary.largest_loss, trip.profit);
            }
        }
        return summary;
    }
};

} // namespace backtest
} // namespace intraday
