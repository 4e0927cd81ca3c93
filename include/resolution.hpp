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
#include "settlement.hpp"

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>

namespace fa {

struct VoteRequest {
    std::string marketId;
    std::string voter;
    std::string outcome;
    std::uint32_t confidence = 5;
    std::uint32_t weight = 1;
    bool isFinal = false;
};

// What a terminal transition committed: the immutable resolution record and the settlement that
// was written with it.
struct ResolutionReport {
    Resolution resolution;
    SettlementReport settlement;
};

class ResolutionCoordinator {
public:
    ResolutionCoordinator(MarketStore& store,
                          MarketLockTable& locks,
                          EventPublisher& events,
                          AuditTrail& audit,
                          SettlementEngine& settlement,
                          const EngineConfig& cfg,
                          Clock clock);

    // One vote per (market, voter); recasting replaces the earlier vote.
    Result<ResolutionVote> castVote(const VoteRequest& request);

    // Weighted tally over the recorded votes. Equal top weights are never broken here.
    Result<ResolutionReport> attemptResolve(const std::string& marketId, const std::string& resolvedBy);

    Result<ResolutionReport> adminResolve(const std::string& marketId,
                                          const std::string& outcome,
                                          const std::string& resolvedBy);

    // The backend is queried before the market lock is taken.
    Result<ResolutionReport> resolveFromOracle(const std::string& marketId,
                                               OracleBackend& oracle,
                                               const std::string& resolvedBy);

    Result<ResolutionReport> refund(const std::string& marketId,
                                    const std::string& requestedBy,
                                    ResolutionMethod method = ResolutionMethod::AdminDecision);

    Result<ResolutionReport> cancel(const std::string& marketId, const std::string& requestedBy);

private:
    struct Decision {
        MarketStatus finalStatus = MarketStatus::Resolved;
        std::optional<std::string> winningOutcome;
        ResolutionMethod method = ResolutionMethod::AdminDecision;
        std::string resolvedBy;
        std::uint64_t voteCount = 0;
        std::string evidence;
    };

    // Runs under the market lock once the status check passed; may fill in the decision or
    // reject the transition.
    using Decider = std::function<std::optional<EngineError>(const Market&, Decision&)>;

    Result<ResolutionReport> finalize(const std::string& marketId,
                                      std::initializer_list<MarketStatus> from,
                                      Decision decision,
                                      const Decider& decide);

    std::optional<EngineError> tally(const Market& market, Decision& decision) const;

    MarketStore& store_;
    MarketLockTable& locks_;
    EventPublisher& events_;
    AuditTrail& audit_;
    SettlementEngine& settlement_;
    const EngineConfig& cfg_;
    Clock clock_;
};

} // namespace fa
