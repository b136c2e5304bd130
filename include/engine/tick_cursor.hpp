#pragma once

#include "../market/price_bar.hpp"

#include <optional>
#include <vector>

namespace intraday {
namespace engine {

/**
 * Tick Cursor
 *
 * Turns successive fetch results (each a full session snapshot) into the
 * ticks not processed yet:
 * - first non-empty fetch: only the latest bar; earlier bars are history
 * - afterwards: every bar newer than the last processed tick, in order
 * - same timestamp as the last processed tick: only if its close moved
 *   (the forming bar was updated)
 * - empty fetch: nothing
 */
class TickCursor {
public:
    std::vector<market::PriceTick> select_new(const std::vector<market::PriceBar>& bars) {
        std::vector<market::PriceTick> fresh;
        if (bars.empty()) {
            return fresh;
        }

        if (!last_) {
            last_ = bars.back().tick();
            fresh.push_back(*last_);
            return fresh;
        }

        market::PriceTick cursor = *last_;
        for (const auto& bar : bars) {
            market::PriceTick tick = bar.tick();
            bool newer = tick.timestamp > cursor.timestamp;
            bool updated = tick.timestamp == cursor.timestamp && tick.close_price != cursor.close_price;
            if (newer || updated) {
                fresh.push_back(tick);
                cursor = tick;
            }
        }

        last_ = cursor;
        return fresh;
    }

    const std::optional<market::PriceTick>& last() const { return last_; }

private:
    std::optional<market::PriceTick> last_;
};

} // namespace engine
} // namespace intraday
