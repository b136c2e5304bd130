#pragma once

#include "../market/bar_interval.hpp"
#include "../util/time_utils.hpp"
#include "trade_event_sink.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace intraday {
namespace sinks {

/**
 * Append-only CSV record of trade events, one row per event
 *
 * Format:
 * type,price,timestamp,profit,reason
 * BUY,2850.25,2025-03-19T14:30:00Z,,
 * SELL,2847.40,2025-03-19T14:32:00Z,-2.85,Stop Loss
 */
class CsvTradeLog : public ITradeEventSink {
public:
    static constexpr const char* HEADER = "type,price,timestamp,profit,reason";

    /**
     * Append to a file; the header is written only when the file is new
     * or empty.
     */
    explicit CsvTradeLog(const std::string& filename) : filename_(filename) {
        std::error_code ec;
        bool fresh = !std::filesystem::exists(filename, ec) || std::filesystem::file_size(filename, ec) == 0;

        file_ = std::make_unique<std::ofstream>(filename, std::ios::app);
        if (!file_->is_open()) {
            throw std::runtime_error("Cannot open trade log: " + filename);
        }
        out_ = file_.get();
        if (fresh) {
            *out_ << HEADER << "\n";
        }
    }

    // Write to a caller-owned stream (header included)
    explicit CsvTradeLog(std::ostream& out) : out_(&out) { *out_ << HEADER << "\n"; }

    void on_event(const TradeEvent& event) override {
        *out_ << format_row(event) << "\n";
        ++rows_;
        if (!*out_) {
            throw std::runtime_error("Failed writing trade log " + filename_);
        }
    }

    void flush() override { out_->flush(); }

    size_t rows() const { return rows_; }
    const std::string& filename() const { return filename_; }

    static std::string format_row(const TradeEvent& event) {
        std::string row = strategy::trade_kind_to_string(event.kind);
        row += ",";
        row += format_price(event.price);
        row += ",";
        row += util::format_iso8601(event.timestamp);
        row += ",";
        if (event.profit) row += format_price(*event.profit);
        row += ",";
        if (event.reason) row += strategy::exit_reason_to_string(*event.reason);
        return row;
    }

    // <symbol>_<YYYY-MM-DD_HH-MM-SS>_<interval>_trades.csv
    static std::string default_filename(const std::string& symbol, market::BarInterval interval, Timestamp start) {
        return symbol + "_" + util::format_file_stamp(start) + "_" + market::interval_to_string(interval) +
               "_trades.csv";
    }

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_ = nullptr;
    std::string filename_;
    size_t rows_ = 0;
};

} // namespace sinks
} // namespace intraday
