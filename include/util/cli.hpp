#pragma once

/**
 * CLI utilities for the intraday trader
 *
 * Provides command-line argument parsing and config overrides.
 */

#include "../config/strategy_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace intraday {
namespace util {

/**
 * Command-line arguments for the trader application.
 *
 * Unset optionals keep the value from the config file (or defaults).
 * Percentages are given in percent here (0.1 = 0.1%).
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    std::string config_file;
    std::string replay_file; // replay bars from CSV instead of polling Yahoo
    std::string trade_log;   // default: <symbol>_<start>_<interval>_trades.csv
    int duration = 0;        // seconds, 0 = until stopped

    std::optional<std::string> symbol;
    std::optional<double> stop_loss_percent;
    std::optional<double> take_profit_percent;
    std::optional<double> max_hold_minutes;
    std::optional<std::string> interval;
    std::optional<double> retry_seconds;
    std::optional<double> status_seconds;
    std::optional<double> timeout_seconds;
};

/**
 * Print help message for the trader application.
 */
inline void print_help() {
    std::cout << R"(
Intraday Trading Simulator
==========================

Buys on the first observed price, then exits on stop-loss, take-profit
or max hold time. Orders are simulated; trades go to a CSV log.

Usage: intraday_trader [options] [SYMBOL]

Options:
  -s, --symbol SYM         Ticker symbol (default: RELIANCE.NS)
  --stop-loss PERCENT      Stop-loss in percent (default: 0.1)
  --take-profit PERCENT    Take-profit in percent (default: 0.2)
  --max-hold MIN           Max holding time in minutes (default: 5)
  -i, --interval I         Bar interval: 1m or 15m (default: 1m)
  --retry SECS             Wait after a failed fetch (default: 60)
  --status SECS            Status line interval (default: poll period)
  --timeout SECS           HTTP fetch timeout (default: 30)
  -c, --config FILE        JSON config file (CLI options override it)
  --replay FILE            Replay bars from CSV instead of live data
  -o, --trade-log FILE     Trade log path
  -d, --duration SECS      Stop after SECS (0 = until Ctrl+C)
  -v, --verbose            Debug logging
  -h, --help               Show this help

Examples:
  intraday_trader                                  # RELIANCE.NS, 1m bars
  intraday_trader -s INFY.NS --stop-loss 0.2 -i 15m
  intraday_trader --replay bars.csv --retry 0.1    # Offline replay

Press Ctrl+C to stop; an open position is closed at the latest price.
)";
}

/**
 * Trim whitespace and uppercase a ticker symbol.
 */
inline std::string normalize_symbol(std::string s) {
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/**
 * Parse a numeric option value.
 * @throws config::ConfigError if the text is not a complete number
 */
inline double parse_number(const std::string& option, const std::string& text) {
    size_t used = 0;
    double value = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw config::ConfigError(option + " expects a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw config::ConfigError(option + " expects a number, got '" + text + "'");
    }
    return value;
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on unknown option or missing value
 * @throws config::ConfigError on a malformed number
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if ((arg == "--symbol" || arg == "-s") && has_value) {
            args.symbol = normalize_symbol(argv[++i]);
        }
        else if (arg == "--stop-loss" && has_value) {
            args.stop_loss_percent = parse_number(arg, argv[++i]);
        }
        else if (arg == "--take-profit" && has_value) {
            args.take_profit_percent = parse_number(arg, argv[++i]);
        }
        else if (arg == "--max-hold" && has_value) {
            args.max_hold_minutes = parse_number(arg, argv[++i]);
        }
        else if ((arg == "--interval" || arg == "-i") && has_value) {
            args.interval = argv[++i];
        }
        else if (arg == "--retry" && has_value) {
            args.retry_seconds = parse_number(arg, argv[++i]);
        }
        else if (arg == "--status" && has_value) {
            args.status_seconds = parse_number(arg, argv[++i]);
        }
        else if (arg == "--timeout" && has_value) {
            args.timeout_seconds = parse_number(arg, argv[++i]);
        }
        else if ((arg == "--config" || arg == "-c") && has_value) {
            args.config_file = argv[++i];
        }
        else if (arg == "--replay" && has_value) {
            args.replay_file = argv[++i];
        }
        else if ((arg == "--trade-log" || arg == "-o") && has_value) {
            args.trade_log = argv[++i];
        }
        else if ((arg == "--duration" || arg == "-d") && has_value) {
            args.duration = static_cast<int>(parse_number(arg, argv[++i]));
        }
        else if (!arg.empty() && arg[0] != '-') {
            args.symbol = normalize_symbol(arg);
        }
        else {
            std::cerr << "Unknown option or missing value: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

namespace detail {
inline DurationMs seconds_to_ms(const char* option, double seconds) {
    if (!(seconds >= 0)) {
        throw config::ConfigError(std::string(option) + " must not be negative");
    }
    return static_cast<DurationMs>(std::llround(seconds * MS_PER_SECOND));
}
} // namespace detail

/**
 * Apply CLI overrides on top of a config (percent -> fraction).
 * Does not validate; call config.validate() afterwards.
 * @throws config::ConfigError on unknown interval or negative duration
 */
inline void apply_overrides(const CLIArgs& args, config::StrategyConfig& config) {
    if (args.symbol) config.symbol = *args.symbol;
    if (args.stop_loss_percent) config.stop_loss_pct = *args.stop_loss_percent / 100.0;
    if (args.take_profit_percent) config.take_profit_pct = *args.take_profit_percent / 100.0;
    if (args.max_hold_minutes) {
        config.max_hold_ms = detail::seconds_to_ms("--max-hold", *args.max_hold_minutes * 60.0);
    }
    if (args.interval) {
        auto interval = market::interval_from_string(*args.interval);
        if (!interval) {
            throw config::ConfigError("Unknown interval '" + *args.interval + "' (expected 1m or 15m)");
        }
        config.interval = *interval;
    }
    if (args.retry_seconds) config.retry_backoff_ms = detail::seconds_to_ms("--retry", *args.retry_seconds);
    if (args.status_seconds) config.status_interval_ms = detail::seconds_to_ms("--status", *args.status_seconds);
    if (args.timeout_seconds) config.fetch_timeout_ms = detail::seconds_to_ms("--timeout", *args.timeout_seconds);
}

} // namespace util
} // namespace intraday
