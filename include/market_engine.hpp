#pragma once

#include "audit_trail.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "market.hpp"
#include "market_lock.hpp"
#include "market_store.hpp"
#include "oracle.hpp"
#include "records.hpp"
#include "resolution.hpp"
#include "settlement.hpp"
#include "trade_executor.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fa {

struct OutcomeState {
    std::string outcome;
    Fixed64 shareReserve;
    Fixed64 cashReserve;
    Fixed64 impliedPrice;
    // impliedPrice, or its normalized share when the engine reports normalized prices.
    Fixed64 displayPrice;
    Fixed64 volume;
    std::uint64_t tradeCount = 0;
};

struct MarketState {
    std::string id;
    std::string question;
    std::string creator;
    MarketStatus status = MarketStatus::Active;
    bool halted = false;
    bool settlementComplete = false;
    Timestamp createdAt;
    Timestamp endTime;
    Timestamp refundDeadline;
    Fixed64 initialLiquidity;
    Fixed64 totalVolume;
    std::uint64_t totalTrades = 0;
    std::optional<std::string> winningOutcome;
    std::vector<OutcomeState> outcomes;
    std::optional<Resolution> resolution;
};

struct SweepSummary {
    std::size_t ended = 0;
    std::size_t refunded = 0;
    // Markets skipped because another operation held the lock; the next sweep picks them up.
    std::size_t busy = 0;
};

// Facade owning every engine component for one store. Not copyable: components keep references
// into the engine.
class MarketEngine {
public:
    explicit MarketEngine(EngineConfig cfg,
                          std::shared_ptr<MarketStore> store = nullptr,
                          EventSinkPtr sink = nullptr,
                          Clock clock = nullptr);

    MarketEngine(const MarketEngine&) = delete;
    MarketEngine& operator=(const MarketEngine&) = delete;

    Result<Market> createMarket(const MarketDefinition& definition);

    Result<Position> placeBet(const std::string& marketId,
                              const std::string& outcome,
                              Fixed64 amount,
                              const std::string& bettor);
    Result<TradeQuote> getQuote(const std::string& marketId, const std::string& outcome, Fixed64 amount) const;

    Result<ResolutionVote> castVote(const VoteRequest& request);

    // With an outcome this is an admin decision; without one the recorded votes decide.
    Result<ResolutionReport> resolve(const std::string& marketId,
                                     const std::optional<std::string>& outcome,
                                     const std::string& resolvedBy);
    Result<ResolutionReport> resolveFromOracle(const std::string& marketId, const std::string& resolvedBy);
    Result<ResolutionReport> refund(const std::string& marketId, const std::string& requestedBy);
    Result<ResolutionReport> cancel(const std::string& marketId, const std::string& requestedBy);

    Result<Market> pause(const std::string& marketId, const std::string& actor);
    // Returns a market past its end time to Ended rather than Active.
    Result<Market> resume(const std::string& marketId, const std::string& actor);
    Result<Market> close(const std::string& marketId, const std::string& actor);

    Result<SettlementReport> settle(const std::string& marketId);

    // Closes markets whose end time passed and refunds unresolved markets past their refund
    // deadline.
    SweepSummary sweep();

    Result<MarketState> getMarketState(const std::string& marketId) const;
    std::vector<std::string> marketIds() const;
    std::vector<Position> positions(const std::string& marketId) const;
    std::vector<Payout> payouts(const std::string& marketId) const;

    // Not synchronized with running requests; configure before serving.
    void setOracle(OraclePtr oracle);
    void setEventSink(EventSinkPtr sink);
    std::size_t flushEvents();
    std::size_t pendingEvents() const;

    std::string auditRoot() const;
    const AuditTrail& audit() const { return audit_; }
    const EventPublisher& events() const { return events_; }
    const EngineConfig& config() const { return cfg_; }

private:
    Result<Market> changeStatus(const std::string& marketId,
                                std::initializer_list<MarketStatus> from,
                                MarketStatus next,
                                const std::string& actor);

    const EngineConfig cfg_;
    Clock clock_;
    std::shared_ptr<MarketStore> store_;
    MarketLockTable locks_;
    EventPublisher events_;
    AuditTrail audit_;
    SettlementEngine settlement_;
    TradeExecutor executor_;
    ResolutionCoordinator resolver_;
    OraclePtr oracle_;
};

} // namespace fa
