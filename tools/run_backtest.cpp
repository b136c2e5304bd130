/**
 * Backtest Runner
 *
 * Replays recorded intraday bars through the same entry/exit rules as the
 * live trader and prints the round trips and a summary.
 *
 * Usage:
 *   ./run_backtest data.csv
 *   ./run_backtest data.csv --stop-loss 0.2 --take-profit 0.4 --max-hold 10
 *   ./run_backtest data.csv --config trader.json -o trades.csv
 */

#include "../include/backtest/bar_backtester.hpp"
#include "../include/config/strategy_config.hpp"
#include "../include/market/price_bar.hpp"
#include "../include/sinks/csv_trade_log.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/time_utils.hpp"

#include <iostream>
#include <memory>

using namespace intraday;
using namespace intraday::backtest;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " DATA_FILE [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --stop-loss PERCENT    Stop-loss in percent (default: 0.1)\n"
              << "  --take-profit PERCENT  Take-profit in percent (default: 0.2)\n"
              << "  --max-hold MIN         Max holding time in minutes (default: 5)\n"
              << "  -c, --config FILE      JSON config file\n"
              << "  -o, --trade-log FILE   Also write trades as CSV\n"
              << "\n"
              << "DATA_FILE format: open_time,open,high,low,close,volume (see fetch_bars)\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " RELIANCE.NS_1m.csv\n"
              << "  " << prog << " RELIANCE.NS_1m.csv --stop-loss 0.2 -o trades.csv\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string data_file = argv[1];

    try {
        // Options follow the data file
        util::CLIArgs args;
        if (!util::parse_args(argc - 1, argv + 1, args)) {
            return 1;
        }

        config::StrategyConfig config;
        if (!args.config_file.empty()) {
            config = config::load_strategy_config(args.config_file, config);
        }
        util::apply_overrides(args, config);
        config.validate();

        std::cout << "Loading data from " << data_file << "...\n";
        auto bars = market::load_bars_csv(data_file);
        if (bars.empty()) {
            std::cerr << "Error: No data loaded from " << data_file << "\n";
            return 1;
        }

        std::cout << "Loaded " << bars.size() << " bars\n";

        Price min_price = bars[0].low;
        Price max_price = bars[0].high;
        for (const auto& b : bars) {
            if (b.low < min_price) min_price = b.low;
            if (b.high > max_price) max_price = b.high;
        }
        std::cout << "Price range: " << format_price(min_price) << " - " << format_price(max_price) << "\n";
        std::cout << "Stop loss " << config.stop_loss_pct * 100 << "%, take profit " << config.take_profit_pct * 100
                  << "%, max hold " << config.max_hold_ms / MS_PER_MINUTE << " min\n\n";

        std::unique_ptr<sinks::CsvTradeLog> trade_log;
        if (!args.trade_log.empty()) {
            trade_log = std::make_unique<sinks::CsvTradeLog>(args.trade_log);
        }

        BarBacktester backtester(config.exit_rules());
        BacktestSummary summary = backtester.run(bars, trade_log.get());

        if (!backtester.round_trips().empty()) {
            backtester.print_round_trips(std::cout);
        }
        summary.print(std::cout);

        if (trade_log) {
            std::cout << "Trades written to " << trade_log->filename() << "\n";
        }
        return 0;

    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
