#include "events.hpp"

#include <stdexcept>
#include <utility>

namespace fa {

const char* toString(EventType type) {
    switch (type) {
    case EventType::TradeExecuted:
        return "trade-executed";
    case EventType::MarketResolved:
        return "market-resolved";
    case EventType::MarketRefunded:
        return "market-refunded";
    case EventType::PayoutReady:
        return "payout-ready";
    case EventType::InvariantViolation:
        return "invariant-violation";
    }
    return "unknown";
}

EventPublisher::EventPublisher(EventSinkPtr sink) : sink_(std::move(sink)) {}

void EventPublisher::setSink(EventSinkPtr sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

std::uint64_t EventPublisher::emit(EventType type,
                                   const std::string& marketId,
                                   std::vector<std::string> userIds,
                                   std::string detail) {
    std::unique_lock<std::mutex> lock(mutex_);
    MarketEvent event;
    event.sequence = nextSequence_++;
    event.type = type;
    event.marketId = marketId;
    event.userIds = std::move(userIds);
    event.detail = std::move(detail);

    // Queued first so delivery order always follows sequence order.
    const std::uint64_t sequence = event.sequence;
    pending_.push_back(std::move(event));
    if (pending_.size() == 1) {
        drain(lock);
    }
    return sequence;
}

std::size_t EventPublisher::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    return drain(lock);
}

std::size_t EventPublisher::drain(std::unique_lock<std::mutex>& lock) {
    if (delivering_) {
        return 0;
    }
    delivering_ = true;
    std::size_t delivered = 0;
    while (!pending_.empty()) {
        const EventSinkPtr sink = sink_;
        const MarketEvent event = pending_.front();
        lock.unlock();
        const bool ok = deliver(sink, event);
        lock.lock();
        if (!ok) {
            break;
        }
        pending_.pop_front();
        ++delivered;
    }
    delivering_ = false;
    return delivered;
}

std::size_t EventPublisher::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::uint64_t EventPublisher::deliveryFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::string EventPublisher::lastDeliveryError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool EventPublisher::deliver(const EventSinkPtr& sink, const MarketEvent& event) {
    if (!sink) {
        // No collaborator attached; nothing to deliver to.
        return true;
    }
    std::string error;
    try {
        sink->publish(event);
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
    } catch (...) {
        error = "unknown exception";
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
    lastError_ = std::move(error);
    return false;
}

} // namespace fa
