#pragma once

#include "../market/bar_interval.hpp"
#include "../strategy/exit_rules.hpp"
#include "../types.hpp"
#include "defaults.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace intraday {
namespace config {

/**
 * Invalid or contradictory parameters. Fatal: reported before the loop
 * starts and before any position can be opened.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Strategy configuration - read at startup, immutable for the run
 *
 * Percentages are decimal fractions (0.001 = 0.1%).
 */
struct StrategyConfig {
    std::string symbol = market::DEFAULT_SYMBOL;

    // Exit rules
    double stop_loss_pct = exits::STOP_LOSS_PCT;
    double take_profit_pct = exits::TAKE_PROFIT_PCT;
    DurationMs max_hold_ms = exits::MAX_HOLD_MINUTES * MS_PER_MINUTE;

    // Polling
    intraday::market::BarInterval interval = intraday::market::BarInterval::OneMinute;
    DurationMs retry_backoff_ms = polling::RETRY_BACKOFF_SECONDS * MS_PER_SECOND;
    DurationMs status_interval_ms = polling::STATUS_INTERVAL_SECONDS * MS_PER_SECOND; // 0 = poll period
    DurationMs fetch_timeout_ms = polling::FETCH_TIMEOUT_SECONDS * MS_PER_SECOND;

    DurationMs poll_interval_ms() const { return intraday::market::interval_period_ms(interval); }

    DurationMs effective_status_interval_ms() const {
        return status_interval_ms > 0 ? status_interval_ms : poll_interval_ms();
    }

    strategy::ExitRules exit_rules() const {
        return strategy::ExitRules{to_rate(stop_loss_pct), to_rate(take_profit_pct), max_hold_ms};
    }

    /**
     * Check all parameters.
     * @throws ConfigError describing the first invalid parameter
     */
    void validate() const {
        if (symbol.empty()) {
            throw ConfigError("symbol must not be empty");
        }
        if (!std::isfinite(stop_loss_pct) || stop_loss_pct <= 0) {
            throw ConfigError("stop_loss_pct must be positive, got " + std::to_string(stop_loss_pct));
        }
        if (stop_loss_pct >= 1) {
            throw ConfigError("stop_loss_pct must be below 1 (100%), got " + std::to_string(stop_loss_pct));
        }
        if (!std::isfinite(take_profit_pct) || take_profit_pct <= 0) {
            throw ConfigError("take_profit_pct must be positive, got " + std::to_string(take_profit_pct));
        }
        if (to_rate(stop_loss_pct) == 0 || to_rate(take_profit_pct) == 0) {
            throw ConfigError("exit percentages below 0.0001% resolution");
        }
        if (max_hold_ms == 0) {
            throw ConfigError("max hold duration must be positive");
        }
        if (retry_backoff_ms == 0) {
            throw ConfigError("retry backoff must be positive");
        }
        if (fetch_timeout_ms == 0) {
            throw ConfigError("fetch timeout must be positive");
        }
    }
};

/**
 * Apply JSON settings on top of base (missing keys keep base values).
 *
 * Keys: symbol, stop_loss_pct, take_profit_pct, max_hold_minutes,
 * interval ("1m" | "15m"), retry_backoff_seconds, status_interval_seconds,
 * fetch_timeout_seconds.
 *
 * @throws ConfigError on malformed JSON, wrong types or unknown keys
 */
StrategyConfig parse_strategy_config(const std::string& json_text, StrategyConfig base = {});

/**
 * Load a JSON config file on top of base.
 * @throws ConfigError if the file cannot be read or parsed
 */
StrategyConfig load_strategy_config(const std::string& filename, StrategyConfig base = {});

} // namespace config
} // namespace intraday
