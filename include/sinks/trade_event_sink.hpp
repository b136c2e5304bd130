#pragma once

#include "../strategy/trade_event.hpp"

#include <cstddef>
#include <vector>

namespace intraday {
namespace sinks {

using strategy::TradeEvent;

/**
 * ITradeEventSink - receives trade events in emission order
 */
class ITradeEventSink {
public:
    virtual ~ITradeEventSink() = default;

    virtual void on_event(const TradeEvent& event) = 0;

    // Push buffered output to its destination
    virtual void flush() {}
};

/**
 * Forwards every event to each registered sink, in registration order.
 * Sinks are not owned.
 */
class FanoutSink : public ITradeEventSink {
public:
    FanoutSink& add(ITradeEventSink& sink) {
        sinks_.push_back(&sink);
        return *this;
    }

    void on_event(const TradeEvent& event) override {
        for (auto* sink : sinks_) {
            sink->on_event(event);
        }
    }

    void flush() override {
        for (auto* sink : sinks_) {
            sink->flush();
        }
    }

    size_t size() const { return sinks_.size(); }

private:
    std::vector<ITradeEventSink*> sinks_;
};

/**
 * Keeps every event in memory
 */
class EventRecorder : public ITradeEventSink {
public:
    void on_event(const TradeEvent& event) override { events_.push_back(event); }

    const std::vector<TradeEvent>& events() const { return events_; }

    size_t buys() const { return count(strategy::TradeKind::Buy); }
    size_t sells() const { return count(strategy::TradeKind::Sell); }

    void clear() { events_.clear(); }

private:
    std::vector<TradeEvent> events_;

    size_t count(strategy::TradeKind kind) const {
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.kind == kind) ++n;
        }
        return n;
    }
};

} // namespace sinks
} // namespace intraday
