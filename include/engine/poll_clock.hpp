#pragma once

#include "../config/defaults.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"
#include "cancellation.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

namespace intraday {
namespace engine {

/**
 * IPollClock - time source and wait primitive for the polling loop
 *
 * The only places the loop blocks are the fetch and wait_for(). Routing
 * waits through this interface lets tests drive the loop without real
 * sleeping.
 */
class IPollClock {
public:
    virtual ~IPollClock() = default;

    // Current wall-clock time (ms since epoch)
    virtual Timestamp now() const = 0;

    /**
     * Wait for duration_ms or until cancellation.
     * @return false if cancelled before the full duration elapsed
     */
    virtual bool wait_for(DurationMs duration_ms, const CancellationToken& cancel) = 0;
};

/**
 * System clock; waits sleep in short slices so cancellation is seen
 * within WAIT_SLICE_MS.
 */
class SystemPollClock : public IPollClock {
public:
    explicit SystemPollClock(DurationMs slice_ms = config::polling::WAIT_SLICE_MS) : slice_ms_(slice_ms) {}

    Timestamp now() const override { return util::wall_clock_ms(); }

    bool wait_for(DurationMs duration_ms, const CancellationToken& cancel) override {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);

        while (!cancel.requested()) {
            auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= std::chrono::steady_clock::duration::zero()) {
                return true;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                remaining, std::chrono::milliseconds(slice_ms_)));
        }
        return false;
    }

private:
    DurationMs slice_ms_;
};

/**
 * Manually driven clock for tests and replay
 *
 * wait_for() advances simulated time instantly and records the request.
 * An optional hook runs before each wait (e.g. to request cancellation
 * after N waits).
 */
class ManualPollClock : public IPollClock {
public:
    using WaitHook = std::function<void(DurationMs)>;

    explicit ManualPollClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }

    bool wait_for(DurationMs duration_ms, const CancellationToken& cancel) override {
        waits_.push_back(duration_ms);
        if (on_wait_) {
            on_wait_(duration_ms);
        }
        if (cancel.requested()) {
            return false;
        }
        now_ += duration_ms;
        return true;
    }

    void advance(DurationMs ms) { now_ += ms; }
    void set_now(Timestamp ts) { now_ = ts; }
    void set_wait_hook(WaitHook hook) { on_wait_ = std::move(hook); }

    const std::vector<DurationMs>& waits() const { return waits_; }

private:
    Timestamp now_;
    std::vector<DurationMs> waits_;
    WaitHook on_wait_;
};

} // namespace engine
} // namespace intraday
