/**
 * Intraday Trader - simulated single-symbol trading loop
 *
 * Polls intraday bars (Yahoo Finance, or a CSV replay), buys on the first
 * observed price and exits on stop-loss, take-profit or max hold time.
 * No real orders are sent. Trades are appended to a CSV log.
 *
 * Usage:
 *   intraday_trader                               # RELIANCE.NS, 1m bars
 *   intraday_trader INFY.NS -i 15m --stop-loss 0.2
 *   intraday_trader --config trader.json -d 3600
 *   intraday_trader --replay RELIANCE_1m.csv      # offline, no waiting
 *   intraday_trader -h                            # Help
 *
 * Ctrl+C closes an open position at the latest price (Manual Stop).
 */

#include "../include/config/strategy_config.hpp"
#include "../include/engine/cancellation.hpp"
#include "../include/engine/poll_clock.hpp"
#include "../include/engine/polling_scheduler.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/csv_replay_feed.hpp"
#include "../include/market/yahoo_chart_feed.hpp"
#include "../include/sinks/csv_trade_log.hpp"
#include "../include/sinks/log_trade_sink.hpp"
#include "../include/sinks/trade_event_sink.hpp"
#include "../include/strategy/position_state_machine.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"
#include "../include/util/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

using namespace intraday;
using namespace intraday::util;

namespace {

engine::CancellationToken g_cancel;

void print_summary(const config::StrategyConfig& config, const strategy::PositionStateMachine& machine,
                   const engine::SchedulerStats& stats, const std::string& trade_log) {
    std::cout << "\n=== Session Summary ===\n"
              << "Symbol:          " << config.symbol << " (" << market::interval_to_string(config.interval) << ")\n"
              << "Fetch cycles:    " << stats.cycles << " (" << stats.fetch_failures << " failed)\n"
              << "Ticks evaluated: " << stats.ticks_evaluated << "\n"
              << "Total Trades:    " << machine.completed_trades() << "\n"
              << "Total Profit:    " << format_price(machine.realized_profit()) << "\n"
              << "Trade log:       " << trade_log << "\n";
}

// Replay runs on simulated time: one cycle per revealed bar, no waiting
void run_replay(engine::PollingScheduler& scheduler, market::CsvReplayFeed& feed, engine::ManualPollClock& clock) {
    try {
        do {
            scheduler.run_cycle();
            if (auto tick = scheduler.latest_tick()) {
                clock.set_now(std::max(clock.now(), tick->timestamp));
            }
        } while (!feed.exhausted() && !g_cancel.requested());
    } catch (...) {
        scheduler.shutdown();
        throw;
    }
    scheduler.shutdown();
}

int run(const CLIArgs& args) {
    config::StrategyConfig config;
    if (!args.config_file.empty()) {
        config = config::load_strategy_config(args.config_file, config);
    }
    apply_overrides(args, config);
    config.validate();

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Info);
    logger.start();

    Timestamp start = wall_clock_ms();
    std::string trade_log = args.trade_log.empty()
                                ? sinks::CsvTradeLog::default_filename(config.symbol, config.interval, start)
                                : args.trade_log;

    sinks::CsvTradeLog csv_log(trade_log);
    sinks::LogTradeSink log_sink(logger);
    sinks::FanoutSink sink;
    sink.add(csv_log).add(log_sink);

    strategy::PositionStateMachine machine(config.exit_rules());

    INTRADAY_LOG_INFO(logger, System, "Stop loss %s%%, take profit %s%%, max hold %llu min, trade log %s",
                      format_price(to_price(config.stop_loss_pct * 100.0)).c_str(),
                      format_price(to_price(config.take_profit_pct * 100.0)).c_str(),
                      static_cast<unsigned long long>(config.max_hold_ms / MS_PER_MINUTE), trade_log.c_str());

    engine::SchedulerStats stats;
    if (!args.replay_file.empty()) {
        auto feed = market::CsvReplayFeed::from_file(args.replay_file);
        INTRADAY_LOG_INFO(logger, Market, "Replaying %zu bars from %s", feed.size(), args.replay_file.c_str());

        engine::ManualPollClock clock(feed.size() > 0 ? feed.bars().front().open_time : start);
        engine::PollingScheduler scheduler(config, feed, machine, sink, clock, logger, g_cancel);
        run_replay(scheduler, feed, clock);
        stats = scheduler.stats();
    } else {
        market::YahooChartFeed feed(static_cast<long>(config.fetch_timeout_ms));
        engine::SystemPollClock clock;
        engine::PollingScheduler scheduler(config, feed, machine, sink, clock, logger, g_cancel);

        std::thread timer;
        if (args.duration > 0) {
            timer = std::thread([&args] {
                engine::SystemPollClock timer_clock;
                if (timer_clock.wait_for(static_cast<DurationMs>(args.duration) * MS_PER_SECOND, g_cancel)) {
                    g_cancel.request();
                }
            });
        }

        try {
            scheduler.run();
        } catch (...) {
            g_cancel.request();
            if (timer.joinable()) {
                timer.join();
            }
            throw;
        }
        if (timer.joinable()) {
            timer.join();
        }
        stats = scheduler.stats();
    }

    logger.stop();
    print_summary(config, machine, stats, trade_log);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    install_shutdown_handler(g_cancel);

    CLIArgs args;
    try {
        if (!parse_args(argc, argv, args))
            return 1;
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (args.help) {
        print_help();
        return 0;
    }

    try {
        return run(args);
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
    } catch (const strategy::StateInvariantViolation& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}
