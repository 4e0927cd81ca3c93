#pragma once

#include "audit_trail.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "market.hpp"
#include "market_lock.hpp"
#include "market_store.hpp"
#include "records.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fa {

struct LiabilityProof {
    std::string merkleRoot;
    Fixed64 totalLiability;
};

struct SettlementReport {
    std::string marketId;
    MarketStatus status = MarketStatus::Resolved;
    std::optional<std::string> winningOutcome;
    std::vector<Payout> payouts;
    Fixed64 totalPaidIn;
    Fixed64 totalGross;
    Fixed64 totalFees;
    Fixed64 totalNet;
    std::size_t settledPositions = 0;
    std::size_t voidedPositions = 0;
    LiabilityProof liability;
    // True when the call found the market already settled and changed nothing.
    bool alreadySettled = false;
};

class SettlementEngine {
public:
    SettlementEngine(MarketStore& store,
                     MarketLockTable& locks,
                     EventPublisher& events,
                     AuditTrail& audit,
                     const EngineConfig& cfg,
                     Clock clock);

    // Computes payouts and position transitions for every Open position of a market whose status
    // is already terminal. Pure; the caller commits the batch.
    SettlementBatch prepare(const Market& market, const std::vector<Position>& positions) const;

    // Retry-safe entry point. Settles whatever is still Open under the market lock; on a market
    // that is already settled it returns the recorded payouts without writing anything.
    Result<SettlementReport> settle(const std::string& marketId);

    SettlementReport summarize(const Market& market,
                               const std::vector<Position>& positions,
                               const std::vector<Payout>& payouts) const;

    // Announces committed payouts. Call after the market lock is released.
    void announce(const SettlementReport& report);

    // Merkle-sum tree over payouts: each node commits to its children and to the net amount
    // they owe, so the root binds both the recipients and the total liability.
    static LiabilityProof snapshotLiabilities(const std::vector<Payout>& payouts);

private:
    void settleResolved(const Market& market,
                        const std::vector<Position>& positions,
                        SettlementBatch& batch) const;
    void settleRefund(const std::vector<Position>& positions, SettlementBatch& batch) const;
    Payout makePayout(const Position& position, PayoutKind kind, Fixed64 gross, Fixed64 fee) const;

    MarketStore& store_;
    MarketLockTable& locks_;
    EventPublisher& events_;
    AuditTrail& audit_;
    const EngineConfig& cfg_;
    Clock clock_;
};

} // namespace fa
