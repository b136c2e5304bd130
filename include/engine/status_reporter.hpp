#pragma once

#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace intraday {
namespace engine {

struct StatusSnapshot {
    Timestamp now = 0;
    Price latest_price = 0;
    const char* position = "None"; // "None" | "LONG"
    uint64_t completed_trades = 0;
};

/**
 * Status Reporter
 *
 * Emits one status line at fixed intervals rather than per cycle. The
 * first call always reports.
 */
class StatusReporter {
public:
    StatusReporter(logging::AsyncLogger& logger, DurationMs interval_ms) : logger_(logger), interval_ms_(interval_ms) {}

    // Returns true if a line was emitted
    bool maybe_report(const StatusSnapshot& snapshot) {
        if (last_report_ && snapshot.now < *last_report_ + interval_ms_) {
            return false;
        }
        report(snapshot);
        return true;
    }

    void report(const StatusSnapshot& snapshot) {
        last_report_ = snapshot.now;
        ++reports_;
        std::string line = format(snapshot);
        INTRADAY_LOG_INFO(logger_, Status, "%s", line.c_str());
    }

    static std::string format(const StatusSnapshot& s) {
        return "Time: " + util::format_timestamp(s.now) + ", Price: " + format_price(s.latest_price) +
               ", Position: " + s.position + ", Trades: " + std::to_string(s.completed_trades);
    }

    uint64_t reports() const { return reports_; }

private:
    logging::AsyncLogger& logger_;
    DurationMs interval_ms_;
    std::optional<Timestamp> last_report_;
    uint64_t reports_ = 0;
};

} // namespace engine
} // namespace intraday
