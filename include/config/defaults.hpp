#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the simulator.
 *
 * All default values are defined here to avoid duplication across:
 * - StrategyConfig
 * - CLI parsing
 * - Tools
 *
 * Naming:
 * - _PCT suffix: percentage as decimal (0.001 = 0.1%)
 * - _SECONDS / _MINUTES / _MS suffix: unit of the duration
 */

namespace intraday::config {

// =============================================================================
// Instrument
// =============================================================================
namespace market {
constexpr const char* DEFAULT_SYMBOL = "RELIANCE.NS";
} // namespace market

// =============================================================================
// Exit Rules
// =============================================================================
namespace exits {
// Stop: 0.1% below entry
constexpr double STOP_LOSS_PCT = 0.001;

// Target: 0.2% above entry
constexpr double TAKE_PROFIT_PCT = 0.002;

// Time exit: close after 5 minutes of tick time
constexpr uint64_t MAX_HOLD_MINUTES = 5;
} // namespace exits

// =============================================================================
// Polling
// =============================================================================
namespace polling {
// Wait after a failed fetch, independent of the poll period
constexpr uint64_t RETRY_BACKOFF_SECONDS = 60;

// HTTP request timeout for the live feed
constexpr uint64_t FETCH_TIMEOUT_SECONDS = 30;

// Status line cadence; 0 = once per poll period
constexpr uint64_t STATUS_INTERVAL_SECONDS = 0;

// Granularity of interruptible waits (cancellation latency)
constexpr uint64_t WAIT_SLICE_MS = 100;
} // namespace polling

} // namespace intraday::config
