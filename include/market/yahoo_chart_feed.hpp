#pragma once

#include "market_data_feed.hpp"

#include <curl/curl.h>
#include <string>
#include <vector>

namespace intraday {
namespace market {

/**
 * Yahoo Finance chart API client for intraday bars
 *
 * Uses libcurl for HTTP and nlohmann::json for the payload.
 * One request per fetch: the current session (range=1d) at the requested
 * interval. Not thread-safe (one CURL handle per instance).
 */
class YahooChartFeed : public IMarketDataFeed {
public:
    static constexpr const char* DEFAULT_BASE_URL = "https://query1.finance.yahoo.com";

    explicit YahooChartFeed(long timeout_ms = 30000, std::string base_url = DEFAULT_BASE_URL);
    ~YahooChartFeed() override;

    // Non-copyable
    YahooChartFeed(const YahooChartFeed&) = delete;
    YahooChartFeed& operator=(const YahooChartFeed&) = delete;

    std::vector<PriceBar> fetch(const std::string& symbol, BarInterval interval) override;

    const char* name() const override { return "yahoo"; }

    std::string chart_url(const std::string& symbol, BarInterval interval) const;

    /**
     * Parse a v8 chart response
     *
     * Format: {"chart": {"result": [{"timestamp": [sec, ...],
     *          "indicators": {"quote": [{"open": [...], "high": [...],
     *          "low": [...], "close": [...], "volume": [...]}]}}],
     *          "error": null}}
     *
     * Rows with a null close are skipped; result is sorted by open_time.
     * @throws FetchError on provider error or malformed payload
     */
    static std::vector<PriceBar> parse_chart_json(const std::string& body);

private:
    std::string base_url_;
    long timeout_ms_;
    CURL* curl_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output);

    std::string http_get(const std::string& url);
};

} // namespace market
} // namespace intraday
