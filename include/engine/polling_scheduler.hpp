#pragma once

#include "../config/strategy_config.hpp"
#include "../logging/async_logger.hpp"
#include "../market/market_data_feed.hpp"
#include "../sinks/trade_event_sink.hpp"
#include "../strategy/position_state_machine.hpp"
#include "cancellation.hpp"
#include "poll_clock.hpp"
#include "status_reporter.hpp"
#include "tick_cursor.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace intraday {
namespace engine {

struct SchedulerStats {
    uint64_t cycles = 0; // fetch attempts
    uint64_t fetch_failures = 0;
    uint64_t consecutive_failures = 0;
    uint64_t ticks_evaluated = 0;
    uint64_t events_emitted = 0;
};

/**
 * Polling Scheduler
 *
 * Drives time, not decisions. Each cycle:
 *   1. fetch bars from the feed
 *   2. on failure: log, wait retry_backoff_ms, retry (never gives up)
 *   3. on success: evaluate every new tick, forward events to the sink
 *   4. wait until the next poll boundary
 *
 * Cancellation (token or shutdown()) ends the loop; the open position, if
 * any, is closed exactly once with ManualStop at the latest known price.
 *
 * All collaborators are borrowed and must outlive the scheduler.
 * run()/run_cycle() belong to one thread; request_stop(), shutdown(),
 * stats() and latest_tick() may be called from any thread.
 *
 * An exception escaping a cycle (a sink that cannot write) ends run():
 * the position is finalized first, then the exception propagates.
 */
class PollingScheduler {
public:
    PollingScheduler(const config::StrategyConfig& config, market::IMarketDataFeed& feed,
                     strategy::PositionStateMachine& machine, sinks::ITradeEventSink& sink, IPollClock& clock,
                     logging::AsyncLogger& logger, CancellationToken& cancel)
        : config_(config), feed_(feed), machine_(machine), sink_(sink), clock_(clock), logger_(logger),
          cancel_(cancel), status_(logger, config.effective_status_interval_ms()) {}

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    /**
     * Run until cancelled, then finalize. Finalizes on every exit path.
     */
    void run() {
        try {
            loop();
        } catch (...) {
            finalize_after_error();
            throw;
        }
        shutdown();
    }

    /**
     * One fetch-and-evaluate cycle, no waiting.
     * @return false if the fetch failed (caller decides when to retry)
     */
    bool run_cycle() {
        {
            std::lock_guard<std::mutex> lock(machine_mutex_);
            ++stats_.cycles;
        }

        // The network call runs unlocked so shutdown() is never held up by it
        std::vector<market::PriceBar> bars;
        try {
            bars = feed_.fetch(config_.symbol, config_.interval);
        } catch (const std::exception& e) {
            on_fetch_failure(e.what());
            return false;
        }

        std::lock_guard<std::mutex> lock(machine_mutex_);
        stats_.consecutive_failures = 0;
        if (finalized_) {
            return true;
        }

        std::vector<market::PriceTick> ticks = cursor_.select_new(bars);
        if (ticks.empty()) {
            INTRADAY_LOG_DEBUG(logger_, Market, "No new ticks (%zu bars)", bars.size());
        }

        for (const auto& tick : ticks) {
            latest_ = tick;
            ++stats_.ticks_evaluated;
            if (auto event = machine_.evaluate(tick)) {
                emit(*event);
            }
        }

        report_status_locked();
        return true;
    }

    void request_stop() { cancel_.request(); }

    /**
     * Close any open position with ManualStop and flush the sink.
     * Runs once; later calls return false and do nothing.
     */
    bool shutdown() {
        cancel_.request();

        std::lock_guard<std::mutex> lock(machine_mutex_);
        if (finalized_) {
            return false;
        }
        finalized_ = true;

        if (machine_.is_long()) {
            const auto& position = *machine_.position();
            Price price = latest_ ? latest_->close_price : position.entry_price;
            Timestamp ts = std::max({clock_.now(), latest_ ? latest_->timestamp : 0, position.entry_time});

            if (auto event = machine_.close_manually(price, ts)) {
                emit(*event);
            }
        }

        sink_.flush();

        std::string profit = format_price(machine_.realized_profit());
        INTRADAY_LOG_INFO(logger_, System, "Stopped after %llu cycles: %llu trades, profit %s",
                          static_cast<unsigned long long>(stats_.cycles),
                          static_cast<unsigned long long>(machine_.completed_trades()), profit.c_str());
        return true;
    }

    bool finalized() const {
        std::lock_guard<std::mutex> lock(machine_mutex_);
        return finalized_;
    }

    SchedulerStats stats() const {
        std::lock_guard<std::mutex> lock(machine_mutex_);
        return stats_;
    }

    std::optional<market::PriceTick> latest_tick() const {
        std::lock_guard<std::mutex> lock(machine_mutex_);
        return latest_;
    }

private:
    const config::StrategyConfig& config_;
    market::IMarketDataFeed& feed_;
    strategy::PositionStateMachine& machine_;
    sinks::ITradeEventSink& sink_;
    IPollClock& clock_;
    logging::AsyncLogger& logger_;
    CancellationToken& cancel_;

    StatusReporter status_;
    TickCursor cursor_;
    SchedulerStats stats_;
    std::optional<market::PriceTick> latest_;

    // Guards the state machine, stats_, latest_ and finalized_
    mutable std::mutex machine_mutex_;
    bool finalized_ = false;

    void loop() {
        std::string poll_s = std::to_string(config_.poll_interval_ms() / MS_PER_SECOND);
        std::string retry_s = std::to_string(config_.retry_backoff_ms / MS_PER_SECOND);
        INTRADAY_LOG_INFO(logger_, System, "Polling %s %s via %s (poll %ss, retry %ss)", config_.symbol.c_str(),
                          market::interval_to_string(config_.interval), feed_.name(), poll_s.c_str(),
                          retry_s.c_str());

        while (!cancel_.requested()) {
            Timestamp cycle_start = clock_.now();
            bool fetched = run_cycle();
            if (cancel_.requested()) {
                break;
            }

            DurationMs wait = config_.retry_backoff_ms;
            if (fetched) {
                Timestamp boundary = cycle_start + config_.poll_interval_ms();
                Timestamp now = clock_.now();
                wait = boundary > now ? boundary - now : 0;
            }

            if (!wait_with_status(wait)) {
                break;
            }
        }
    }

    void emit(const strategy::TradeEvent& event) {
        ++stats_.events_emitted;
        sink_.on_event(event);
    }

    // Best effort: the original exception is what the caller sees
    void finalize_after_error() {
        try {
            shutdown();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(machine_mutex_);
            INTRADAY_LOG_ERROR(logger_, System, "Finalization after failure also failed: %s", e.what());
        }
    }

    void on_fetch_failure(const char* what) {
        std::lock_guard<std::mutex> lock(machine_mutex_);
        ++stats_.fetch_failures;
        ++stats_.consecutive_failures;
        std::string retry_s = std::to_string(config_.retry_backoff_ms / MS_PER_SECOND);
        INTRADAY_LOG_WARN(logger_, Market, "Data fetch error: %s; retrying in %ss (attempt %llu)", what,
                          retry_s.c_str(), static_cast<unsigned long long>(stats_.consecutive_failures));
    }

    void report_status_locked() {
        if (!latest_) {
            return;
        }
        status_.maybe_report(
            StatusSnapshot{clock_.now(), latest_->close_price, machine_.position_label(), machine_.completed_trades()});
    }

    // Wait in status-interval chunks so status lines keep their own cadence
    bool wait_with_status(DurationMs total) {
        DurationMs chunk = std::max<DurationMs>(config_.effective_status_interval_ms(), 1);
        while (total > 0) {
            DurationMs step = std::min(total, chunk);
            if (!clock_.wait_for(step, cancel_)) {
                return false;
            }
            total -= step;

            std::lock_guard<std::mutex> lock(machine_mutex_);
            report_status_locked();
        }
        return !cancel_.requested();
    }
};

} // namespace engine
} // namespace intraday
