#pragma once

#include <atomic>

namespace intraday {
namespace engine {

/**
 * Cooperative cancellation flag
 *
 * request() is a single lock-free atomic exchange, safe to call from a
 * signal handler or any thread. The polling loop checks requested() at the
 * top of each cycle and while waiting.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns true only for the first request
    bool request() { return !requested_.exchange(true, std::memory_order_acq_rel); }

    bool requested() const { return requested_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> requested_{false};
    static_assert(std::atomic<bool>::is_always_lock_free, "cancellation must be signal-safe");
};

} // namespace engine
} // namespace intraday
