#pragma once

#include "audit_trail.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "market.hpp"
#include "market_lock.hpp"
#include "market_store.hpp"
#include "records.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fa {

struct TradeQuote {
    std::string marketId;
    std::string outcome;
    BuyQuote quote;
    std::int64_t priceImpactBps = 0;
};

class TradeExecutor {
public:
    TradeExecutor(MarketStore& store,
                  MarketLockTable& locks,
                  EventPublisher& events,
                  AuditTrail& audit,
                  const EngineConfig& cfg,
                  Clock clock);

    // Read-quote-apply-write under the market lock. Throws InvariantViolationError after halting
    // the market when a pool is found outside tolerance.
    Result<Position> placeBet(const std::string& marketId,
                              const std::string& outcome,
                              Fixed64 cashIn,
                              const std::string& bettor);

    // Read-only; prices against the last committed reserves.
    Result<TradeQuote> quote(const std::string& marketId, const std::string& outcome, Fixed64 cashIn) const;

private:
    std::optional<EngineError> validateAmount(Fixed64 cashIn) const;
    void haltMarket(const std::string& marketId, const InvariantViolationError& error);

    MarketStore& store_;
    MarketLockTable& locks_;
    EventPublisher& events_;
    AuditTrail& audit_;
    const EngineConfig& cfg_;
    Clock clock_;
};

} // namespace fa
