#pragma once

#include "bar_interval.hpp"
#include "price_bar.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace intraday {
namespace market {

/**
 * Transient provider failure (network down, HTTP error, malformed payload).
 * The polling loop backs off and retries; it never terminates on it.
 */
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * IMarketDataFeed - source of price bars for one symbol
 *
 * Implementations:
 * - YahooChartFeed: live intraday bars over HTTP
 * - CsvReplayFeed: recorded bars revealed one per fetch
 */
class IMarketDataFeed {
public:
    virtual ~IMarketDataFeed() = default;

    /**
     * Fetch the freshest bars available.
     *
     * @return Bars ordered by open_time (possibly empty)
     * @throws FetchError on provider failure
     */
    virtual std::vector<PriceBar> fetch(const std::string& symbol, BarInterval interval) = 0;

    virtual const char* name() const = 0;
};

} // namespace market
} // namespace intraday
