#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../include/market/bar_interval.hpp"
#include "../include/market/csv_replay_feed.hpp"
#include "../include/market/price_bar.hpp"
#include "../include/market/yahoo_chart_feed.hpp"

using namespace intraday;
using namespace intraday::market;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_THROWS(expr, type) do { \
    bool thrown = false; \
    try { expr; } catch (const type&) { thrown = true; } \
    assert(thrown); \
} while(0)

const char* CHART_JSON = R"({
  "chart": {
    "result": [{
      "meta": {"symbol": "RELIANCE.NS", "currency": "INR"},
      "timestamp": [1742374860, 1742374800, 1742374920],
      "indicators": {
        "quote": [{
          "open":   [2850.5, 2850.0, null],
          "high":   [2851.0, 2850.8, null],
          "low":    [2849.9, 2849.5, null],
          "close":  [2850.25, 2850.6, null],
          "volume": [1200, 3400, null]
        }]
      }
    }],
    "error": null
  }
})";

TEST(test_interval_names) {
    ASSERT_EQ(std::string(interval_to_string(BarInterval::OneMinute)), "1m");
    ASSERT_EQ(std::string(interval_to_string(BarInterval::FifteenMinutes)), "15m");
    ASSERT_TRUE(*interval_from_string("15m") == BarInterval::FifteenMinutes);
    ASSERT_FALSE(interval_from_string("5m").has_value());
    ASSERT_EQ(interval_period_ms(BarInterval::OneMinute), 60000u);
    ASSERT_EQ(interval_period_ms(BarInterval::FifteenMinutes), 900000u);
}

// Null rows dropped, seconds to ms, sorted by time
TEST(test_parse_chart_json) {
    auto bars = YahooChartFeed::parse_chart_json(CHART_JSON);

    ASSERT_EQ(bars.size(), 2u);
    ASSERT_EQ(bars[0].open_time, 1742374800000ull);
    ASSERT_EQ(bars[0].close, to_price(2850.6));
    ASSERT_EQ(bars[1].open_time, 1742374860000ull);
    ASSERT_EQ(bars[1].open, to_price(2850.5));
    ASSERT_EQ(bars[1].close, to_price(2850.25));
    ASSERT_EQ(bars[1].volume, 1200.0);
}

TEST(test_parse_chart_empty_session) {
    auto bars = YahooChartFeed::parse_chart_json(
        R"({"chart": {"result": [{"meta": {}, "indicators": {"quote": [{}]}}], "error": null}})");
    ASSERT_TRUE(bars.empty());
}

TEST(test_parse_chart_errors) {
    ASSERT_THROWS(YahooChartFeed::parse_chart_json("<html>"), FetchError);
    ASSERT_THROWS(YahooChartFeed::parse_chart_json(R"({"foo": 1})"), FetchError);
    ASSERT_THROWS(YahooChartFeed::parse_chart_json(
                      R"({"chart": {"result": null, "error": {"code": "Not Found",
                          "description": "No data found, symbol may be delisted"}}})"),
                  FetchError);
    ASSERT_THROWS(YahooChartFeed::parse_chart_json(R"({"chart": {"result": [], "error": null}})"), FetchError);
}

TEST(test_chart_url) {
    YahooChartFeed feed(1000, "http://localhost:1");
    ASSERT_EQ(feed.chart_url("RELIANCE.NS", BarInterval::FifteenMinutes),
              "http://localhost:1/v8/finance/chart/RELIANCE.NS?interval=15m&range=1d&includePrePost=false");
    ASSERT_EQ(feed.chart_url("^NSEI", BarInterval::OneMinute),
              "http://localhost:1/v8/finance/chart/%5ENSEI?interval=1m&range=1d&includePrePost=false");
}

// Unreachable endpoint surfaces as FetchError (retryable)
TEST(test_fetch_failure_is_fetch_error) {
    YahooChartFeed feed(500, "http://127.0.0.1:1");
    ASSERT_THROWS(feed.fetch("RELIANCE.NS", BarInterval::OneMinute), FetchError);
}

TEST(test_bars_csv) {
    std::istringstream in("open_time,open,high,low,close,volume\n"
                          "1742374800000,2850.0,2850.8,2849.5,2850.6,3400\n"
                          "1742374860000,2850.5,2851.0,2849.9,2850.25,1200\r\n"
                          "\n");
    auto bars = parse_bars_csv(in);

    ASSERT_EQ(bars.size(), 2u);
    ASSERT_EQ(bars[1].open_time, 1742374860000ull);
    ASSERT_EQ(bars[1].close, to_price(2850.25));
    ASSERT_EQ(bars[0].tick().close_price, to_price(2850.6));

    std::ostringstream out;
    write_bars_csv(out, bars);
    std::istringstream again(out.str());
    auto reread = parse_bars_csv(again);
    ASSERT_EQ(reread.size(), 2u);
    ASSERT_EQ(reread[1].close, bars[1].close);
}

TEST(test_bars_csv_malformed) {
    std::istringstream short_row("1742374800000,2850.0,2850.8\n");
    ASSERT_THROWS(parse_bars_csv(short_row), std::runtime_error);

    std::istringstream bad_number("1742374800000,abc,2850.8,2849.5,2850.6,1\n");
    ASSERT_THROWS(parse_bars_csv(bad_number), std::runtime_error);
}

// Each fetch reveals one more bar of the session
TEST(test_replay_feed) {
    PriceBar a;
    a.open_time = 2000;
    a.close = to_price(11.0);
    PriceBar b;
    b.open_time = 1000;
    b.close = to_price(10.0);

    CsvReplayFeed feed({a, b});
    ASSERT_EQ(feed.size(), 2u);
    ASSERT_FALSE(feed.exhausted());

    auto first = feed.fetch("X", BarInterval::OneMinute);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(first[0].open_time, 1000u);

    auto second = feed.fetch("X", BarInterval::OneMinute);
    ASSERT_EQ(second.size(), 2u);
    ASSERT_EQ(second[1].open_time, 2000u);
    ASSERT_TRUE(feed.exhausted());

    ASSERT_EQ(feed.fetch("X", BarInterval::OneMinute).size(), 2u);
}

int main() {
    std::cout << "=== Bar Feed Tests ===\n";

    RUN_TEST(test_interval_names);
    RUN_TEST(test_parse_chart_json);
    RUN_TEST(test_parse_chart_empty_session);
    RUN_TEST(test_parse_chart_errors);
    RUN_TEST(test_chart_url);
    RUN_TEST(test_fetch_failure_is_fetch_error);
    RUN_TEST(test_bars_csv);
    RUN_TEST(test_bars_csv_malformed);
    RUN_TEST(test_replay_feed);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
