#include "../../include/config/strategy_config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace intraday::config {

using json = nlohmann::json;

namespace {

double number_field(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw ConfigError(std::string("'") + key + "' must be a number");
    }
    return v.get<double>();
}

// Non-negative duration in the given unit, converted to milliseconds
DurationMs duration_field(const json& j, const char* key, DurationMs unit_ms) {
    double value = number_field(j, key);
    if (!std::isfinite(value) || value < 0) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative duration");
    }
    return static_cast<DurationMs>(std::llround(value * static_cast<double>(unit_ms)));
}

} // namespace

StrategyConfig parse_strategy_config(const std::string& json_text, StrategyConfig base) {
    StrategyConfig config = std::move(base);

    json data;
    try {
        data = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed config JSON: ") + e.what());
    }

    if (!data.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string& key = it.key();

        if (key == "symbol") {
            if (!it.value().is_string()) throw ConfigError("'symbol' must be a string");
            config.symbol = it.value().get<std::string>();
        } else if (key == "stop_loss_pct") {
            config.stop_loss_pct = number_field(data, "stop_loss_pct");
        } else if (key == "take_profit_pct") {
            config.take_profit_pct = number_field(data, "take_profit_pct");
        } else if (key == "max_hold_minutes") {
            config.max_hold_ms = duration_field(data, "max_hold_minutes", MS_PER_MINUTE);
        } else if (key == "interval") {
            if (!it.value().is_string()) throw ConfigError("'interval' must be a string");
            auto interval = intraday::market::interval_from_string(it.value().get<std::string>());
            if (!interval) {
                throw ConfigError("Unknown interval: " + it.value().get<std::string>() + " (use 1m or 15m)");
            }
            config.interval = *interval;
        } else if (key == "retry_backoff_seconds") {
            config.retry_backoff_ms = duration_field(data, "retry_backoff_seconds", MS_PER_SECOND);
        } else if (key == "status_interval_seconds") {
            config.status_interval_ms = duration_field(data, "status_interval_seconds", MS_PER_SECOND);
        } else if (key == "fetch_timeout_seconds") {
            config.fetch_timeout_ms = duration_field(data, "fetch_timeout_seconds", MS_PER_SECOND);
        } else {
            throw ConfigError("Unknown config key: " + key);
        }
    }

    return config;
}

StrategyConfig load_strategy_config(const std::string& filename, StrategyConfig base) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_strategy_config(buffer.str(), std::move(base));
}

} // namespace intraday::config
