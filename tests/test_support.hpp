#pragma once

#include "events.hpp"
#include "market.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace fa::testing {

// Settable time source shared by copies of the returned Clock.
class ManualClock {
public:
    ManualClock() : millis_(std::make_shared<std::atomic<std::int64_t>>(1'760'000'000'000)) {}

    Timestamp now() const { return Timestamp(std::chrono::milliseconds(millis_->load())); }

    void advance(std::chrono::milliseconds delta) { millis_->fetch_add(delta.count()); }

    Clock clock() const {
        auto millis = millis_;
        return [millis] { return Timestamp(std::chrono::milliseconds(millis->load())); };
    }

private:
    std::shared_ptr<std::atomic<std::int64_t>> millis_;
};

// Keeps every delivered event; throws while failing is set.
class RecordingSink : public EventSink {
public:
    void publish(const MarketEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing) {
            throw std::runtime_error("sink offline");
        }
        events_.push_back(event);
    }

    std::vector<MarketEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::size_t count(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                ++n;
            }
        }
        return n;
    }

    std::atomic<bool> failing{ false };

private:
    mutable std::mutex mutex_;
    std::vector<MarketEvent> events_;
};

inline MarketDefinition binaryMarket(Timestamp now, std::chrono::minutes duration = std::chrono::minutes(60)) {
    MarketDefinition definition;
    definition.question = "Will the launch happen on schedule?";
    definition.outcomes = { "Yes", "No" };
    definition.endTime = now + duration;
    definition.creator = "creator-1";
    return definition;
}

} // namespace fa::testing
