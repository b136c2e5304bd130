/**
 * Intraday Bar Fetcher
 *
 * Downloads the current session's bars from Yahoo Finance and saves them
 * to CSV (input for run_backtest and intraday_trader --replay).
 *
 * Usage:
 *   ./fetch_bars RELIANCE.NS
 *   ./fetch_bars INFY.NS 15m infy_15m.csv
 */

#include "../include/market/bar_interval.hpp"
#include "../include/market/price_bar.hpp"
#include "../include/market/yahoo_chart_feed.hpp"
#include "../include/util/time_utils.hpp"

#include <iostream>

using namespace intraday;
using namespace intraday::market;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " SYMBOL [INTERVAL] [OUTPUT_FILE]\n"
              << "\n"
              << "Arguments:\n"
              << "  SYMBOL      Ticker (e.g., RELIANCE.NS, INFY.NS)\n"
              << "  INTERVAL    Bar interval: 1m or 15m, default: 1m\n"
              << "  OUTPUT_FILE Output CSV file, default: SYMBOL_INTERVAL.csv\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " RELIANCE.NS\n"
              << "  " << prog << " INFY.NS 15m infy_15m.csv\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string symbol = argv[1];
    std::string interval_str = (argc >= 3) ? argv[2] : "1m";

    auto interval = interval_from_string(interval_str);
    if (!interval) {
        std::cerr << "Error: Invalid interval '" << interval_str << "'\n";
        std::cerr << "Valid intervals: 1m, 15m\n";
        return 1;
    }

    std::string output_file = (argc >= 4) ? argv[3] : symbol + "_" + interval_str + ".csv";

    try {
        YahooChartFeed feed;
        std::cout << "Fetching " << symbol << " " << interval_str << " bars\n";
        std::cout << "URL: " << feed.chart_url(symbol, *interval) << "\n\n";

        auto bars = feed.fetch(symbol, *interval);
        if (bars.empty()) {
            std::cerr << "No bars returned (market closed or unknown symbol?)\n";
            return 1;
        }

        std::cout << "Downloaded " << bars.size() << " bars\n";
        std::cout << "\nData Summary:\n";
        std::cout << "  First: " << util::format_timestamp(bars.front().open_time) << " UTC\n";
        std::cout << "  Last:  " << util::format_timestamp(bars.back().open_time) << " UTC\n";

        Price min_price = bars[0].low;
        Price max_price = bars[0].high;
        double total_volume = 0;
        for (const auto& b : bars) {
            if (b.low < min_price) min_price = b.low;
            if (b.high > max_price) max_price = b.high;
            total_volume += b.volume;
        }

        std::cout << "  Low:    " << format_price(min_price) << "\n";
        std::cout << "  High:   " << format_price(max_price) << "\n";
        std::cout << "  Last:   " << format_price(bars.back().close) << "\n";
        std::cout << "  Volume: " << static_cast<uint64_t>(total_volume) << "\n";

        std::cout << "\nSaving to " << output_file << "... ";
        save_bars_csv(output_file, bars);
        std::cout << "done!\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
