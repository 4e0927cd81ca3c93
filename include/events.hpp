#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fa {

enum class EventType { TradeExecuted, MarketResolved, MarketRefunded, PayoutReady, InvariantViolation };

const char* toString(EventType type);

struct MarketEvent {
    std::uint64_t sequence = 0;
    EventType type = EventType::TradeExecuted;
    std::string marketId;
    std::vector<std::string> userIds;
    std::string detail;
};

// Notification collaborator. publish() may throw; the publisher keeps the event for redelivery.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const MarketEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

// Stamps a monotonically increasing sequence number and delivers best-effort. Events whose
// delivery failed stay queued until flush() gets them through (at-least-once). The sink is called
// without the publisher lock held and by one thread at a time; an emit that finds another thread
// delivering leaves its event for that thread.
class EventPublisher {
public:
    explicit EventPublisher(EventSinkPtr sink = nullptr);

    void setSink(EventSinkPtr sink);

    // Returns the sequence number assigned to the event.
    std::uint64_t emit(EventType type,
                       const std::string& marketId,
                       std::vector<std::string> userIds,
                       std::string detail);

    // Retries queued events in sequence order. Returns how many were delivered.
    std::size_t flush();

    std::size_t pendingCount() const;
    std::uint64_t deliveryFailures() const;
    std::string lastDeliveryError() const;

private:
    // Sends queued events in order until the queue is empty or a delivery fails. Expects lock to
    // hold mutex_; releases it around each publish call.
    std::size_t drain(std::unique_lock<std::mutex>& lock);
    bool deliver(const EventSinkPtr& sink, const MarketEvent& event);

    mutable std::mutex mutex_;
    EventSinkPtr sink_;
    bool delivering_ = false;
    std::uint64_t nextSequence_ = 1;
    std::deque<MarketEvent> pending_;
    std::uint64_t failures_ = 0;
    std::string lastError_;
};

} // namespace fa
