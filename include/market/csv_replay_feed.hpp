#pragma once

#include "market_data_feed.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace intraday {
namespace market {

/**
 * CsvReplayFeed - replays recorded bars as if they arrived live
 *
 * Every fetch reveals one more bar and returns the whole prefix seen so
 * far, the way an intraday provider returns the session so far. Once all
 * bars are revealed, further fetches return the full set unchanged.
 *
 * Usage:
 *   CsvReplayFeed feed = CsvReplayFeed::from_file("RELIANCE_1m.csv");
 *   while (!feed.exhausted()) scheduler.run_cycle();
 */
class CsvReplayFeed : public IMarketDataFeed {
public:
    explicit CsvReplayFeed(std::vector<PriceBar> bars) : bars_(std::move(bars)) {
        std::stable_sort(bars_.begin(), bars_.end(),
                         [](const PriceBar& a, const PriceBar& b) { return a.open_time < b.open_time; });
    }

    static CsvReplayFeed from_file(const std::string& filename) { return CsvReplayFeed(load_bars_csv(filename)); }

    std::vector<PriceBar> fetch(const std::string& symbol, BarInterval interval) override {
        (void)symbol;
        (void)interval;

        if (revealed_ < bars_.size()) {
            ++revealed_;
        }
        return std::vector<PriceBar>(bars_.begin(), bars_.begin() + static_cast<std::ptrdiff_t>(revealed_));
    }

    const char* name() const override { return "csv-replay"; }

    bool exhausted() const { return revealed_ >= bars_.size(); }
    size_t size() const { return bars_.size(); }
    const std::vector<PriceBar>& bars() const { return bars_; }

private:
    std::vector<PriceBar> bars_;
    size_t revealed_ = 0;
};

} // namespace market
} // namespace intraday
