#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace fa {

// Arena of per-market execution locks. Every trade and every terminal transition on a market
// runs while holding that market's guard; different markets never contend.
class MarketLockTable {
public:
    class Guard {
    public:
        Guard(Guard&&) noexcept = default;
        Guard& operator=(Guard&&) noexcept = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        const std::string& marketId() const { return marketId_; }

    private:
        friend class MarketLockTable;
        Guard(std::string marketId, std::shared_ptr<std::timed_mutex> handle, std::unique_lock<std::timed_mutex> lock)
            : marketId_(std::move(marketId)), handle_(std::move(handle)), lock_(std::move(lock)) {}

        std::string marketId_;
        // Declared before lock_ so the mutex outlives the unlock in the destructor.
        std::shared_ptr<std::timed_mutex> handle_;
        std::unique_lock<std::timed_mutex> lock_;
    };

    // Empty when the lock could not be taken within timeout.
    std::optional<Guard> tryAcquire(const std::string& marketId, std::chrono::milliseconds timeout);

    // Drops handles nobody holds or waits on. Returns the number removed.
    std::size_t prune();

    std::size_t size() const;

private:
    std::shared_ptr<std::timed_mutex> handleFor(const std::string& marketId);

    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> handles_;
};

} // namespace fa
