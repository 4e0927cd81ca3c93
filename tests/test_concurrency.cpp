#include "market_engine.hpp"
#include "market_lock.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "concurrency_test failure: " << msg << std::endl;
    std::exit(1);
}

constexpr int kThreads = 8;
constexpr int kBetsPerThread = 25;

} // namespace

int main() {
    using namespace fa;
    using namespace std::chrono_literals;

    testing::ManualClock clock;
    EngineConfig cfg;
    cfg.lockTimeout = 50ms;
    MarketEngine engine(cfg, nullptr, nullptr, clock.clock());

    auto created = engine.createMarket(testing::binaryMarket(clock.now()));
    if (!created) {
        fail("createMarket");
    }
    const std::string id = created.value().id;

    // Many bettors hammer the same outcome; busy results are retried as callers are told to.
    std::atomic<int> failures{ 0 };
    std::atomic<int> retries{ 0 };
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kBetsPerThread; ++i) {
                const Fixed64 amount(1 + t * kBetsPerThread + i);
                const std::string bettor = "user-" + std::to_string(t);
                for (;;) {
                    auto placed = engine.placeBet(id, "Yes", amount, bettor);
                    if (placed) {
                        break;
                    }
                    if (!isRetryable(placed.kind())) {
                        ++failures;
                        break;
                    }
                    ++retries;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (failures != 0) {
        fail(std::to_string(failures.load()) + " bets failed");
    }

    // Replaying the committed trades in lock-acquisition order reproduces the pool exactly.
    const auto positions = engine.positions(id);
    if (positions.size() != static_cast<std::size_t>(kThreads * kBetsPerThread)) {
        fail("position count " + std::to_string(positions.size()));
    }
    auto replay = OutcomePool::seed("Yes", cfg.defaultInitialLiquidity);
    Fixed64 volume;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        const Position& position = positions[i];
        if (position.sequence != i + 1) {
            fail("sequence gap at " + std::to_string(i));
        }
        auto shares = replay.applyBuy(position.amountPaid, "replay");
        if (!shares || shares.value() != position.sharesAcquired) {
            fail("replay diverged at sequence " + std::to_string(position.sequence));
        }
        volume += position.amountPaid;
    }

    auto state = engine.getMarketState(id);
    const OutcomeState& yes = state.value().outcomes.front();
    if (yes.shareReserve != replay.shareReserve() || yes.cashReserve != replay.cashReserve()) {
        fail("final reserves differ from sequential replay");
    }
    if (state.value().totalVolume != volume || state.value().totalTrades != positions.size() ||
        yes.tradeCount != positions.size()) {
        fail("counters differ from sequential replay");
    }
    const OutcomeState& no = state.value().outcomes.back();
    if (no.cashReserve != Fixed64(30'000) || no.tradeCount != 0) {
        fail("untouched outcome moved");
    }
    if (engine.audit().size() != positions.size() + 1) {
        fail("audit record count");
    }

    // Different markets never contend.
    MarketLockTable locks;
    {
        auto first = locks.tryAcquire("m-1", 10ms);
        std::atomic<bool> otherAcquired{ false };
        std::thread other([&] {
            otherAcquired = locks.tryAcquire("m-2", 10ms).has_value();
        });
        other.join();
        if (!first || !otherAcquired) {
            fail("independent market locks contended");
        }

        std::atomic<bool> sameAcquired{ true };
        std::thread same([&] {
            sameAcquired = locks.tryAcquire("m-1", 10ms).has_value();
        });
        same.join();
        if (sameAcquired) {
            fail("held lock acquired twice");
        }
    }
    if (locks.size() != 2 || locks.prune() != 2 || locks.size() != 0) {
        fail("idle lock handles not pruned");
    }

    std::cout << "concurrency_test passed (" << retries.load() << " busy retries)\n";
    return 0;
}
