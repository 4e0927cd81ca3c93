#include "market.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace fa {

const char* toString(MarketStatus status) {
    switch (status) {
    case MarketStatus::Active:
        return "active";
    case MarketStatus::Paused:
        return "paused";
    case MarketStatus::Ended:
        return "ended";
    case MarketStatus::Resolved:
        return "resolved";
    case MarketStatus::Refunded:
        return "refunded";
    case MarketStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool isTerminal(MarketStatus status) {
    return status == MarketStatus::Resolved || status == MarketStatus::Refunded ||
           status == MarketStatus::Cancelled;
}

bool canTransition(MarketStatus from, MarketStatus to) {
    switch (from) {
    case MarketStatus::Active:
        return to == MarketStatus::Paused || to == MarketStatus::Ended || to == MarketStatus::Cancelled;
    case MarketStatus::Paused:
        return to == MarketStatus::Active || to == MarketStatus::Ended || to == MarketStatus::Cancelled;
    case MarketStatus::Ended:
        return to == MarketStatus::Resolved || to == MarketStatus::Refunded ||
               to == MarketStatus::Cancelled;
    case MarketStatus::Resolved:
    case MarketStatus::Refunded:
    case MarketStatus::Cancelled:
        return false;
    }
    return false;
}

Result<Market> Market::create(std::string id,
                              const MarketDefinition& definition,
                              Timestamp now,
                              const EngineConfig& cfg) {
    auto invalid = [](const std::string& reason) {
        return Result<Market>::failure(ErrorKind::InvalidMarketDefinition, reason);
    };

    if (definition.question.empty()) {
        return invalid("question must not be empty");
    }
    if (definition.outcomes.size() < 2) {
        return invalid("a market needs at least two outcomes");
    }
    if (definition.outcomes.size() > cfg.maxOutcomes) {
        return invalid("a market allows at most " + std::to_string(cfg.maxOutcomes) + " outcomes");
    }
    std::unordered_set<std::string> seen;
    for (const auto& outcome : definition.outcomes) {
        if (outcome.empty()) {
            return invalid("outcome labels must not be empty");
        }
        if (!seen.insert(outcome).second) {
            return invalid("duplicate outcome \"" + outcome + "\"");
        }
    }
    if (definition.endTime <= now + cfg.minMarketDuration) {
        return invalid("end time must be later than the minimum market duration");
    }
    if (definition.endTime > now + cfg.maxMarketDuration) {
        return invalid("end time exceeds the maximum market duration");
    }
    if (definition.resolutionDeadline && *definition.resolutionDeadline <= definition.endTime) {
        return invalid("resolution deadline must be after the end time");
    }
    Fixed64 liquidity = definition.initialLiquidity.value_or(cfg.defaultInitialLiquidity);
    if (!liquidity.isPositive()) {
        return invalid("initial liquidity must be positive");
    }

    Market market;
    market.id = std::move(id);
    market.question = definition.question;
    market.creator = definition.creator;
    market.outcomes = definition.outcomes;
    market.createdAt = now;
    market.endTime = definition.endTime;
    market.resolutionDeadline = definition.resolutionDeadline;
    market.initialLiquidity = liquidity;
    market.pools.reserve(definition.outcomes.size());
    for (const auto& outcome : definition.outcomes) {
        market.pools.push_back(OutcomePool::seed(outcome, liquidity));
    }
    return Result<Market>::success(std::move(market));
}

bool Market::hasOutcome(const std::string& outcome) const {
    return std::find(outcomes.begin(), outcomes.end(), outcome) != outcomes.end();
}

const OutcomePool* Market::pool(const std::string& outcome) const {
    for (const auto& p : pools) {
        if (p.outcome() == outcome) {
            return &p;
        }
    }
    return nullptr;
}

OutcomePool* Market::pool(const std::string& outcome) {
    for (auto& p : pools) {
        if (p.outcome() == outcome) {
            return &p;
        }
    }
    return nullptr;
}

bool Market::transition(std::initializer_list<MarketStatus> expected, MarketStatus next) {
    if (std::find(expected.begin(), expected.end(), status) == expected.end()) {
        return false;
    }
    if (!canTransition(status, next)) {
        return false;
    }
    status = next;
    return true;
}

Timestamp Market::refundDeadline(const EngineConfig& cfg) const {
    if (resolutionDeadline) {
        return *resolutionDeadline;
    }
    return endTime + cfg.autoRefundAfter;
}

} // namespace fa
