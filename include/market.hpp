#pragma once

#include "engine_config.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "outcome_pool.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace fa {

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;

inline std::uint64_t toEpochMillis(Timestamp t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

enum class MarketStatus { Active, Paused, Ended, Resolved, Refunded, Cancelled };

const char* toString(MarketStatus status);
bool isTerminal(MarketStatus status);
bool canTransition(MarketStatus from, MarketStatus to);

struct MarketDefinition {
    std::string question;
    std::vector<std::string> outcomes;
    Timestamp endTime;
    std::optional<Timestamp> resolutionDeadline;
    std::optional<Fixed64> initialLiquidity;
    std::string creator;
};

struct Market {
    std::string id;
    std::string question;
    std::string creator;
    std::vector<std::string> outcomes;
    MarketStatus status = MarketStatus::Active;
    Timestamp createdAt;
    Timestamp endTime;
    std::optional<Timestamp> resolutionDeadline;
    Fixed64 initialLiquidity;
    Fixed64 totalVolume;
    std::uint64_t totalTrades = 0;
    std::vector<OutcomePool> pools;
    std::optional<std::string> winningOutcome;
    // Set when a pool invariant breaks; no further trades until an operator intervenes.
    bool halted = false;
    bool settlementComplete = false;

    static Result<Market> create(std::string id,
                                 const MarketDefinition& definition,
                                 Timestamp now,
                                 const EngineConfig& cfg);

    bool hasOutcome(const std::string& outcome) const;
    const OutcomePool* pool(const std::string& outcome) const;
    OutcomePool* pool(const std::string& outcome);

    // Compare-and-set on status: succeeds only when the current status is one of expected and the
    // move is a legal edge of the lifecycle.
    bool transition(std::initializer_list<MarketStatus> expected, MarketStatus next);

    // Deadline after which an unresolved Ended market is refunded automatically.
    Timestamp refundDeadline(const EngineConfig& cfg) const;
};

} // namespace fa
