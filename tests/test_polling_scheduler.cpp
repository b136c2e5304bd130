#include <atomic>
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../include/config/strategy_config.hpp"
#include "../include/engine/polling_scheduler.hpp"
#include "../include/sinks/csv_trade_log.hpp"
#include "../include/sinks/trade_event_sink.hpp"
#include "../include/util/time_utils.hpp"

using namespace intraday;
using namespace intraday::engine;
using market::PriceBar;
using strategy::ExitReason;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

const Timestamp T0 = util::make_utc_timestamp(2025, 3, 19, 4, 0, 0);

PriceBar bar(int minute, double close) {
    PriceBar b;
    b.open_time = T0 + static_cast<Timestamp>(minute) * MS_PER_MINUTE;
    b.open = b.high = b.low = b.close = to_price(close);
    return b;
}

/**
 * Feed driven by a script: each fetch consumes one step, either a
 * failure or a snapshot. After the script runs out the last snapshot
 * repeats.
 */
class ScriptedFeed : public market::IMarketDataFeed {
public:
    ScriptedFeed& fail(const std::string& message = "connection timed out") {
        steps_.push_back(Step{true, message, {}});
        return *this;
    }

    ScriptedFeed& fail_unexpected() {
        steps_.push_back(Step{true, "", {}});
        return *this;
    }

    ScriptedFeed& bars(std::vector<PriceBar> snapshot) {
        steps_.push_back(Step{false, "", std::move(snapshot)});
        return *this;
    }

    std::vector<PriceBar> fetch(const std::string& symbol, market::BarInterval interval) override {
        (void)symbol;
        (void)interval;
        ++fetches_;

        if (next_ < steps_.size()) {
            const Step& step = steps_[next_++];
            if (step.fails && step.message.empty()) {
                throw std::runtime_error("unexpected payload");
            }
            if (step.fails) {
                throw market::FetchError(step.message);
            }
            last_ = step.snapshot;
        }
        return last_;
    }

    const char* name() const override { return "scripted"; }

    size_t fetches() const { return fetches_; }

private:
    struct Step {
        bool fails;
        std::string message;
        std::vector<PriceBar> snapshot;
    };

    std::vector<Step> steps_;
    size_t next_ = 0;
    size_t fetches_ = 0;
    std::vector<PriceBar> last_;
};

// Feed that never delivers
class DownFeed : public market::IMarketDataFeed {
public:
    std::vector<PriceBar> fetch(const std::string&, market::BarInterval) override {
        throw market::FetchError("connection refused");
    }
    const char* name() const override { return "down"; }
};

// Sink that rejects the first event and records the rest
class RejectFirstSink : public sinks::ITradeEventSink {
public:
    void on_event(const strategy::TradeEvent& event) override {
        if (!rejected_) {
            rejected_ = true;
            throw std::runtime_error("disk full");
        }
        accepted_.push_back(event);
    }
    void flush() override {}

    const std::vector<strategy::TradeEvent>& accepted() const { return accepted_; }

private:
    bool rejected_ = false;
    std::vector<strategy::TradeEvent> accepted_;
};

config::StrategyConfig make_config(market::BarInterval interval = market::BarInterval::OneMinute) {
    config::StrategyConfig config;
    config.symbol = "RELIANCE.NS";
    config.interval = interval;
    return config;
}

// Everything one scheduler needs, wired to manual time
struct Harness {
    config::StrategyConfig config;
    ScriptedFeed feed;
    strategy::PositionStateMachine machine;
    sinks::EventRecorder recorder;
    ManualPollClock clock;
    logging::AsyncLogger logger;
    CancellationToken cancel;
    std::vector<std::string> lines;

    explicit Harness(const config::StrategyConfig& cfg = make_config())
        : config(cfg), machine(cfg.exit_rules()), clock(T0) {
        logger.set_output_callback([this](const logging::LogEntry& e) { lines.push_back(e.message); });
    }

    bool logged(const std::string& needle) {
        logger.drain();
        for (const auto& line : lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

TEST(test_first_cycle_buys_latest) {
    Harness h;
    h.feed.bars({bar(0, 2850.00), bar(1, 2850.25)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    ASSERT_TRUE(scheduler.run_cycle());
    ASSERT_EQ(h.recorder.events().size(), 1u);
    ASSERT_TRUE(h.recorder.events()[0].is_buy());
    ASSERT_EQ(h.recorder.events()[0].price, to_price(2850.25));
    ASSERT_EQ(h.recorder.events()[0].timestamp, bar(1, 0).open_time);
    ASSERT_EQ(scheduler.stats().ticks_evaluated, 1u);
}

// N failures: no events, no crash; the next success resumes normally
TEST(test_fetch_failures_then_recovery) {
    Harness h;
    h.feed.fail().fail().fail().bars({bar(0, 100.0)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    ASSERT_FALSE(scheduler.run_cycle());
    ASSERT_FALSE(scheduler.run_cycle());
    ASSERT_FALSE(scheduler.run_cycle());
    ASSERT_TRUE(h.recorder.events().empty());
    ASSERT_TRUE(h.machine.is_flat());
    ASSERT_EQ(scheduler.stats().fetch_failures, 3u);
    ASSERT_EQ(scheduler.stats().consecutive_failures, 3u);
    ASSERT_TRUE(h.logged("Data fetch error: connection timed out"));
    ASSERT_TRUE(h.logged("attempt 3"));

    ASSERT_TRUE(scheduler.run_cycle());
    ASSERT_EQ(h.recorder.buys(), 1u);
    ASSERT_EQ(scheduler.stats().consecutive_failures, 0u);
    ASSERT_EQ(scheduler.stats().fetch_failures, 3u);
}

// Any exception from the feed is a failed fetch, not a crash
TEST(test_unexpected_feed_exception_is_retried) {
    Harness h;
    h.feed.fail_unexpected().bars({bar(0, 100.0)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    ASSERT_FALSE(scheduler.run_cycle());
    ASSERT_TRUE(h.logged("unexpected payload"));
    ASSERT_TRUE(scheduler.run_cycle());
    ASSERT_EQ(h.recorder.buys(), 1u);
}

// Failed fetch waits the retry backoff; success waits the poll period
TEST(test_run_waits_backoff_then_poll_period) {
    Harness h(make_config(market::BarInterval::FifteenMinutes));
    h.feed.fail().fail().bars({bar(0, 100.0)});
    h.clock.set_wait_hook([&h](DurationMs) {
        if (h.clock.waits().size() == 3) h.cancel.request();
    });
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.run();

    const auto& waits = h.clock.waits();
    ASSERT_EQ(waits.size(), 3u);
    ASSERT_EQ(waits[0], 60 * MS_PER_SECOND);
    ASSERT_EQ(waits[1], 60 * MS_PER_SECOND);
    ASSERT_EQ(waits[2], 15 * MS_PER_MINUTE);
    ASSERT_EQ(h.feed.fetches(), 3u);

    // Cancelled while long: closed once with Manual Stop at the latest price
    const auto& events = h.recorder.events();
    ASSERT_EQ(events.size(), 2u);
    ASSERT_TRUE(events[0].is_buy());
    ASSERT_TRUE(events[1].is_sell());
    ASSERT_TRUE(*events[1].reason == ExitReason::ManualStop);
    ASSERT_EQ(events[1].price, to_price(100.0));
    ASSERT_EQ(events[1].timestamp, T0 + 2 * 60 * MS_PER_SECOND);
    ASSERT_TRUE(scheduler.finalized());
}

TEST(test_cancel_before_run) {
    Harness h;
    h.feed.bars({bar(0, 100.0)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.request_stop();
    scheduler.run();

    ASSERT_EQ(h.feed.fetches(), 0u);
    ASSERT_TRUE(h.recorder.events().empty());
    ASSERT_TRUE(scheduler.finalized());
}

// Growing session snapshot: exits fire and re-entries follow
TEST(test_run_alternates_events) {
    Harness h;
    std::vector<PriceBar> session;
    const double prices[] = {100.0, 100.05, 99.85, 99.90, 100.30, 100.30, 100.31, 100.32, 100.33,
                             100.34, 100.35, 100.36, 100.37, 100.30};
    for (int i = 0; i < 14; ++i) {
        session.push_back(bar(i, prices[i]));
        h.feed.bars(session);
    }
    h.clock.set_wait_hook([&h](DurationMs) {
        if (h.clock.waits().size() == 14) h.cancel.request();
    });
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.run();

    const auto& events = h.recorder.events();
    // BUY 100.0, SL 99.85, BUY 99.90, TP 100.30, BUY 100.30, TIME 100.35,
    // BUY 100.36, MANUAL 100.30
    ASSERT_EQ(events.size(), 8u);
    for (size_t i = 0; i < events.size(); ++i) {
        ASSERT_EQ(events[i].is_buy(), i % 2 == 0);
        if (i > 0) ASSERT_TRUE(events[i].timestamp >= events[i - 1].timestamp);
    }
    ASSERT_TRUE(*events[1].reason == ExitReason::StopLoss);
    ASSERT_TRUE(*events[3].reason == ExitReason::TakeProfit);
    ASSERT_TRUE(*events[5].reason == ExitReason::TimeExit);
    ASSERT_TRUE(*events[7].reason == ExitReason::ManualStop);
    ASSERT_EQ(events[7].price, to_price(100.30));
    ASSERT_EQ(h.machine.completed_trades(), 4u);
}

TEST(test_shutdown_is_idempotent) {
    Harness h;
    h.feed.bars({bar(0, 100.0)}).bars({bar(0, 100.0), bar(1, 100.05)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.run_cycle();
    scheduler.run_cycle();

    ASSERT_TRUE(scheduler.shutdown());
    ASSERT_FALSE(scheduler.shutdown());
    ASSERT_FALSE(scheduler.shutdown());

    ASSERT_EQ(h.recorder.sells(), 1u);
    ASSERT_EQ(h.recorder.events().back().price, to_price(100.05));
    ASSERT_EQ(*h.recorder.events().back().profit, to_price(0.05));

    // No trading after finalization
    ASSERT_TRUE(scheduler.run_cycle());
    ASSERT_EQ(h.recorder.events().size(), 2u);
}

TEST(test_shutdown_when_flat_emits_nothing) {
    Harness h;
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    ASSERT_TRUE(scheduler.shutdown());
    ASSERT_TRUE(h.recorder.events().empty());
    ASSERT_TRUE(h.cancel.requested());
}

// Concurrent stop requests close the position exactly once
TEST(test_concurrent_shutdown) {
    Harness h;
    h.feed.bars({bar(0, 100.0)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);
    scheduler.run_cycle();

    std::vector<std::thread> threads;
    std::atomic<int> finalized{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (scheduler.shutdown()) finalized.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_EQ(finalized.load(), 1);
    ASSERT_EQ(h.recorder.sells(), 1u);
}

TEST(test_status_line) {
    Harness h;
    h.feed.bars({bar(0, 2850.25)});
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.run_cycle();
    ASSERT_TRUE(h.logged("Time: 2025-03-19 04:00:00, Price: 2850.25, Position: LONG, Trades: 0"));
}

// No status output before a price is known
TEST(test_no_status_without_price) {
    Harness h;
    h.feed.fail();
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.run_cycle();
    ASSERT_FALSE(h.logged("Position:"));
}

// Status has its own cadence, also during long waits
TEST(test_status_interval_splits_waits) {
    auto config = make_config(market::BarInterval::FifteenMinutes);
    config.status_interval_ms = 5 * MS_PER_MINUTE;
    Harness h(config);
    h.feed.bars({bar(0, 100.0)});
    h.clock.set_wait_hook([&h](DurationMs) {
        if (h.clock.waits().size() == 4) h.cancel.request();
    });
    PollingScheduler scheduler(h.config, h.feed, h.machine, h.recorder, h.clock, h.logger, h.cancel);

    scheduler.run();

    const auto& waits = h.clock.waits();
    ASSERT_EQ(waits.size(), 4u);
    ASSERT_EQ(waits[0], 5 * MS_PER_MINUTE);
    ASSERT_EQ(waits[1], 5 * MS_PER_MINUTE);
    ASSERT_EQ(waits[2], 5 * MS_PER_MINUTE);
    ASSERT_TRUE(h.logged("Time: 2025-03-19 04:05:00"));
    ASSERT_TRUE(h.logged("Time: 2025-03-19 04:10:00"));
}

// Shutdown from another thread while the loop thread keeps cycling
TEST(test_shutdown_races_running_cycles) {
    auto config = make_config();
    DownFeed feed;
    strategy::PositionStateMachine machine(config.exit_rules());
    sinks::EventRecorder recorder;
    ManualPollClock clock(T0);
    logging::AsyncLogger logger;
    CancellationToken cancel;
    PollingScheduler scheduler(config, feed, machine, recorder, clock, logger, cancel);

    const int cycles = 20000;
    std::atomic<int> finalized{0};
    std::thread loop([&] {
        for (int i = 0; i < cycles; ++i) scheduler.run_cycle();
    });
    std::thread stopper([&] {
        for (int i = 0; i < 2000; ++i) {
            if (scheduler.shutdown()) finalized.fetch_add(1);
            (void)scheduler.stats();
        }
    });
    loop.join();
    stopper.join();

    ASSERT_EQ(finalized.load(), 1);
    SchedulerStats stats = scheduler.stats();
    ASSERT_EQ(stats.cycles, static_cast<uint64_t>(cycles));
    ASSERT_EQ(stats.fetch_failures, static_cast<uint64_t>(cycles));
    // One WARN per failed fetch plus the shutdown summary, none lost to a torn push
    ASSERT_EQ(logger.total_logged() + logger.dropped_count(), static_cast<uint64_t>(cycles) + 1);
    ASSERT_TRUE(recorder.events().empty());
}

// A sink failure ends run() but the position is still closed first
TEST(test_run_finalizes_when_sink_throws) {
    Harness h;
    h.feed.bars({bar(0, 100.0)});
    RejectFirstSink sink;
    PollingScheduler scheduler(h.config, h.feed, h.machine, sink, h.clock, h.logger, h.cancel);

    bool thrown = false;
    try {
        scheduler.run();
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "disk full";
    }

    ASSERT_TRUE(thrown);
    ASSERT_TRUE(scheduler.finalized());
    ASSERT_TRUE(h.cancel.requested());
    ASSERT_TRUE(h.machine.is_flat());
    ASSERT_EQ(sink.accepted().size(), 1u);
    ASSERT_TRUE(sink.accepted()[0].is_sell());
    ASSERT_TRUE(*sink.accepted()[0].reason == ExitReason::ManualStop);
    ASSERT_EQ(sink.accepted()[0].price, to_price(100.0));
}

// Trade log that cannot write: the original error surfaces, the position is closed
TEST(test_run_with_broken_trade_log) {
    Harness h;
    h.feed.bars({bar(0, 100.0)});
    std::ostringstream out;
    sinks::CsvTradeLog log(out);
    out.setstate(std::ios::badbit);
    PollingScheduler scheduler(h.config, h.feed, h.machine, log, h.clock, h.logger, h.cancel);

    bool thrown = false;
    try {
        scheduler.run();
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()).find("Failed writing trade log") != std::string::npos;
    }

    ASSERT_TRUE(thrown);
    ASSERT_TRUE(scheduler.finalized());
    ASSERT_TRUE(h.machine.is_flat());
    ASSERT_EQ(h.machine.completed_trades(), 1u);
    ASSERT_TRUE(h.logged("Finalization after failure also failed"));
}

int main() {
    std::cout << "=== Polling Scheduler Tests ===\n";

    RUN_TEST(test_first_cycle_buys_latest);
    RUN_TEST(test_fetch_failures_then_recovery);
    RUN_TEST(test_unexpected_feed_exception_is_retried);
    RUN_TEST(test_run_waits_backoff_then_poll_period);
    RUN_TEST(test_cancel_before_run);
    RUN_TEST(test_run_alternates_events);
    RUN_TEST(test_shutdown_is_idempotent);
    RUN_TEST(test_shutdown_when_flat_emits_nothing);
    RUN_TEST(test_concurrent_shutdown);
    RUN_TEST(test_shutdown_races_running_cycles);
    RUN_TEST(test_run_finalizes_when_sink_throws);
    RUN_TEST(test_run_with_broken_trade_log);
    RUN_TEST(test_status_line);
    RUN_TEST(test_no_status_without_price);
    RUN_TEST(test_status_interval_splits_waits);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
