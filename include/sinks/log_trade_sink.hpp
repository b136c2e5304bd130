#pragma once

#include "../logging/async_logger.hpp"
#include "../util/time_utils.hpp"
#include "trade_event_sink.hpp"

#include <string>

namespace intraday {
namespace sinks {

/**
 * Writes each trade event as a log line:
 *   BUY executed at 2850.25 on 2025-03-19 14:30:00
 *   SELL executed at 2847.40 on 2025-03-19 14:32:00, Profit: -2.85, Reason: Stop Loss
 */
class LogTradeSink : public ITradeEventSink {
public:
    explicit LogTradeSink(logging::AsyncLogger& logger) : logger_(logger) {}

    void on_event(const TradeEvent& event) override {
        std::string line = describe(event);
        INTRADAY_LOG_INFO(logger_, Position, "%s", line.c_str());
    }

    static std::string describe(const TradeEvent& event) {
        std::string line = std::string(strategy::trade_kind_to_string(event.kind)) + " executed at " +
                           format_price(event.price) + " on " + util::format_timestamp(event.timestamp);
        if (event.is_sell()) {
            line += ", Profit: " + format_price(event.profit.value_or(0));
            line += ", Reason: ";
            line += event.reason ? strategy::exit_reason_to_string(*event.reason) : "-";
        }
        return line;
    }

private:
    logging::AsyncLogger& logger_;
};

} // namespace sinks
} // namespace intraday
