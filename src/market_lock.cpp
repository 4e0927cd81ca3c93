#include "market_lock.hpp"

namespace fa {

std::shared_ptr<std::timed_mutex> MarketLockTable::handleFor(const std::string& marketId) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto& handle = handles_[marketId];
    if (!handle) {
        handle = std::make_shared<std::timed_mutex>();
    }
    return handle;
}

std::optional<MarketLockTable::Guard> MarketLockTable::tryAcquire(const std::string& marketId,
                                                                  std::chrono::milliseconds timeout) {
    auto handle = handleFor(marketId);
    std::unique_lock<std::timed_mutex> lock(*handle, std::defer_lock);
    if (!lock.try_lock_for(timeout)) {
        return std::nullopt;
    }
    return Guard(marketId, std::move(handle), std::move(lock));
}

std::size_t MarketLockTable::prune() {
    std::lock_guard<std::mutex> lock(tableMutex_);
    std::size_t removed = 0;
    for (auto it = handles_.begin(); it != handles_.end();) {
        // Copies are only made under tableMutex_, so a count of one means no holder or waiter.
        if (it->second.use_count() == 1) {
            it = handles_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t MarketLockTable::size() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return handles_.size();
}

} // namespace fa
