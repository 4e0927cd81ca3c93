#include "resolution.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace fa {

ResolutionCoordinator::ResolutionCoordinator(MarketStore& store,
                                             MarketLockTable& locks,
                                             EventPublisher& events,
                                             AuditTrail& audit,
                                             SettlementEngine& settlement,
                                             const EngineConfig& cfg,
                                             Clock clock)
    : store_(store),
      locks_(locks),
      events_(events),
      audit_(audit),
      settlement_(settlement),
      cfg_(cfg),
      clock_(std::move(clock)) {}

Result<ResolutionVote> ResolutionCoordinator::castVote(const VoteRequest& request) {
    if (request.voter.empty()) {
        return Result<ResolutionVote>::failure(ErrorKind::InvalidVote, "voter id must not be empty");
    }
    if (request.confidence < 1 || request.confidence > 10) {
        return Result<ResolutionVote>::failure(ErrorKind::InvalidVote, "confidence must be between 1 and 10");
    }
    if (request.weight < 1) {
        return Result<ResolutionVote>::failure(ErrorKind::InvalidVote, "vote weight must be at least 1");
    }

    auto guard = locks_.tryAcquire(request.marketId, cfg_.lockTimeout);
    if (!guard) {
        return Result<ResolutionVote>::failure(ErrorKind::MarketBusy,
                                               "market " + request.marketId + " is busy, retry the vote");
    }
    auto market = store_.loadMarket(request.marketId);
    if (!market) {
        return Result<ResolutionVote>::failure(ErrorKind::MarketNotFound, "unknown market " + request.marketId);
    }
    if (isTerminal(market->status)) {
        return Result<ResolutionVote>::failure(ErrorKind::MarketFinalized,
                                               std::string("market is already ") + toString(market->status));
    }
    // Voting opens once betting is over, whether or not a sweep has closed the market yet.
    const Timestamp now = clock_();
    const bool ended = market->status == MarketStatus::Ended ||
                       ((market->status == MarketStatus::Active || market->status == MarketStatus::Paused) &&
                        now >= market->endTime);
    if (!ended) {
        return Result<ResolutionVote>::failure(ErrorKind::MarketNotEnded,
                                               std::string("voting opens when the market ends; market is ") +
                                                   toString(market->status));
    }
    if (!market->hasOutcome(request.outcome)) {
        return Result<ResolutionVote>::failure(ErrorKind::InvalidOutcome,
                                               "\"" + request.outcome + "\" is not an outcome of this market");
    }

    ResolutionVote vote;
    vote.marketId = request.marketId;
    vote.voter = request.voter;
    vote.chosenOutcome = request.outcome;
    vote.confidence = request.confidence;
    vote.weight = request.weight;
    vote.isFinal = request.isFinal;
    vote.castAt = now;
    store_.upsertVote(vote);
    return Result<ResolutionVote>::success(std::move(vote));
}

std::optional<EngineError> ResolutionCoordinator::tally(const Market& market, Decision& decision) const {
    const auto votes = store_.loadVotes(market.id);
    decision.voteCount = votes.size();
    if (votes.size() < cfg_.minResolutionVotes) {
        return EngineError{ ErrorKind::InsufficientVotes,
                            std::to_string(votes.size()) + " of " + std::to_string(cfg_.minResolutionVotes) +
                                " required votes recorded" };
    }

    std::map<std::string, std::uint64_t> weights;
    for (const auto& vote : votes) {
        weights[vote.chosenOutcome] += vote.weight;
    }

    std::uint64_t best = 0;
    std::vector<std::string> leaders;
    for (const auto& [outcome, weight] : weights) {
        if (weight > best) {
            best = weight;
            leaders.assign(1, outcome);
        } else if (weight == best) {
            leaders.push_back(outcome);
        }
    }
    if (leaders.size() != 1) {
        std::string tied;
        for (const auto& outcome : leaders) {
            tied += (tied.empty() ? "" : ", ") + outcome;
        }
        return EngineError{ ErrorKind::ResolutionTied,
                            "tied at weight " + std::to_string(best) + " between " + tied };
    }
    decision.winningOutcome = leaders.front();
    decision.evidence = "votes=" + std::to_string(votes.size()) + " weight=" + std::to_string(best);
    return std::nullopt;
}

Result<ResolutionReport> ResolutionCoordinator::attemptResolve(const std::string& marketId,
                                                               const std::string& resolvedBy) {
    Decision decision;
    decision.finalStatus = MarketStatus::Resolved;
    decision.method = ResolutionMethod::VoteConsensus;
    decision.resolvedBy = resolvedBy;
    return finalize(marketId, { MarketStatus::Ended }, std::move(decision), [this](const Market& market, Decision& d) {
        return tally(market, d);
    });
}

Result<ResolutionReport> ResolutionCoordinator::adminResolve(const std::string& marketId,
                                                             const std::string& outcome,
                                                             const std::string& resolvedBy) {
    Decision decision;
    decision.finalStatus = MarketStatus::Resolved;
    decision.method = ResolutionMethod::AdminDecision;
    decision.resolvedBy = resolvedBy;
    decision.winningOutcome = outcome;
    return finalize(marketId, { MarketStatus::Ended }, std::move(decision), [this](const Market& market, Decision& d) {
        d.voteCount = store_.loadVotes(market.id).size();
        if (!market.hasOutcome(*d.winningOutcome)) {
            return std::optional<EngineError>(EngineError{
                ErrorKind::InvalidOutcome, "\"" + *d.winningOutcome + "\" is not an outcome of this market" });
        }
        return std::optional<EngineError>();
    });
}

Result<ResolutionReport> ResolutionCoordinator::resolveFromOracle(const std::string& marketId,
                                                                  OracleBackend& oracle,
                                                                  const std::string& resolvedBy) {
    OracleObservation observation;
    try {
        observation = oracle.fetchObservation(marketId);
    } catch (const std::exception& ex) {
        return Result<ResolutionReport>::failure(ErrorKind::OracleUnavailable,
                                                 std::string("oracle query failed: ") + ex.what());
    }

    Decision decision;
    decision.finalStatus = MarketStatus::Resolved;
    decision.method = ResolutionMethod::Oracle;
    decision.resolvedBy = resolvedBy;
    decision.winningOutcome = observation.winningOutcome;
    decision.evidence = observation.evidence;
    if (!observation.signature.empty()) {
        decision.evidence += " signature=" + observation.signature;
    }
    return finalize(marketId, { MarketStatus::Ended }, std::move(decision), [this](const Market& market, Decision& d) {
        d.voteCount = store_.loadVotes(market.id).size();
        if (!market.hasOutcome(*d.winningOutcome)) {
            return std::optional<EngineError>(EngineError{
                ErrorKind::InvalidOutcome, "oracle reported unknown outcome \"" + *d.winningOutcome + "\"" });
        }
        return std::optional<EngineError>();
    });
}

Result<ResolutionReport> ResolutionCoordinator::refund(const std::string& marketId,
                                                       const std::string& requestedBy,
                                                       ResolutionMethod method) {
    Decision decision;
    decision.finalStatus = MarketStatus::Refunded;
    decision.method = method;
    decision.resolvedBy = requestedBy;
    return finalize(marketId, { MarketStatus::Ended }, std::move(decision), [this](const Market& market, Decision& d) {
        d.voteCount = store_.loadVotes(market.id).size();
        return std::optional<EngineError>();
    });
}

Result<ResolutionReport> ResolutionCoordinator::cancel(const std::string& marketId, const std::string& requestedBy) {
    Decision decision;
    decision.finalStatus = MarketStatus::Cancelled;
    decision.method = ResolutionMethod::AdminDecision;
    decision.resolvedBy = requestedBy;
    return finalize(marketId,
                    { MarketStatus::Active, MarketStatus::Paused, MarketStatus::Ended },
                    std::move(decision),
                    [this](const Market& market, Decision& d) {
                        d.voteCount = store_.loadVotes(market.id).size();
                        return std::optional<EngineError>();
                    });
}

Result<ResolutionReport> ResolutionCoordinator::finalize(const std::string& marketId,
                                                         std::initializer_list<MarketStatus> from,
                                                         Decision decision,
                                                         const Decider& decide) {
    ResolutionReport report;
    std::set<std::string> bettors;
    {
        auto guard = locks_.tryAcquire(marketId, cfg_.lockTimeout);
        if (!guard) {
            return Result<ResolutionReport>::failure(ErrorKind::MarketBusy,
                                                     "market " + marketId + " is locked by another operation");
        }

        auto market = store_.loadMarket(marketId);
        if (!market) {
            return Result<ResolutionReport>::failure(ErrorKind::MarketNotFound, "unknown market " + marketId);
        }
        const MarketStatus prior = market->status;
        const Timestamp now = clock_();
        if (isTerminal(prior)) {
            return Result<ResolutionReport>::failure(ErrorKind::MarketFinalized,
                                                     std::string("market is already ") + toString(prior));
        }
        // Betting is over at endTime even if no sweep has closed the market yet.
        if ((prior == MarketStatus::Active || prior == MarketStatus::Paused) && now >= market->endTime) {
            market->status = MarketStatus::Ended;
        }
        const MarketStatus effective = market->status;
        if (std::find(from.begin(), from.end(), effective) == from.end()) {
            return Result<ResolutionReport>::failure(
                ErrorKind::MarketNotEnded, std::string("market is ") + toString(effective) + ", not ended");
        }

        if (auto rejected = decide(*market, decision)) {
            return Result<ResolutionReport>::failure(*rejected);
        }

        if (!market->transition({ effective }, decision.finalStatus)) {
            return Result<ResolutionReport>::failure(ErrorKind::MarketNotActive,
                                                     std::string("cannot move a ") + toString(effective) +
                                                         " market to " + toString(decision.finalStatus));
        }
        market->winningOutcome = decision.winningOutcome;

        SettlementBatch batch = settlement_.prepare(*market, store_.loadPositions(marketId));
        report.settlement = settlement_.summarize(batch.market, batch.positions, batch.payouts);

        Resolution& resolution = report.resolution;
        resolution.marketId = marketId;
        resolution.winningOutcome = decision.winningOutcome;
        resolution.method = decision.method;
        resolution.finalStatus = decision.finalStatus;
        resolution.resolvedBy = decision.resolvedBy;
        resolution.resolvedAt = now;
        resolution.voteCount = decision.voteCount;
        resolution.evidence = decision.evidence;
        resolution.totalPool = market->totalVolume;
        for (const auto& position : batch.positions) {
            bettors.insert(position.bettor);
            if (decision.winningOutcome && position.outcome == *decision.winningOutcome) {
                resolution.totalWinningStake += position.amountPaid;
            } else if (decision.winningOutcome) {
                resolution.totalLosingStake += position.amountPaid;
            }
        }
        if (decision.finalStatus == MarketStatus::Resolved) {
            resolution.houseEdgeBps = cfg_.houseEdgeBps;
            resolution.disputeDeadline = now + cfg_.disputeWindow;
        }
        resolution.totalFees = report.settlement.totalFees;
        resolution.totalPayout = report.settlement.totalNet;
        resolution.liabilityRoot = report.settlement.liability.merkleRoot;
        batch.resolution = resolution;

        if (!store_.commitSettlement(batch, prior)) {
            return Result<ResolutionReport>::failure(ErrorKind::MarketFinalized,
                                                     "market status changed before the resolution committed");
        }

        AuditRecord record;
        record.kind = AuditKind::StatusChanged;
        record.timestampMs = toEpochMillis(now);
        record.amountRaw = resolution.totalPool.raw();
        record.feeRaw = resolution.totalFees.raw();
        record.marketId = marketId;
        record.actor = decision.resolvedBy;
        record.outcome = decision.winningOutcome.value_or("");
        record.status = toString(decision.finalStatus);
        record.liabilityRoot = resolution.liabilityRoot;
        record.detail = std::string(toString(decision.method)) + " " + decision.evidence;
        audit_.record(record);

        record.kind = AuditKind::Settled;
        record.amountRaw = report.settlement.totalNet.raw();
        record.detail = std::to_string(report.settlement.payouts.size()) + " payouts";
        audit_.record(record);
    }

    const std::vector<std::string> users(bettors.begin(), bettors.end());
    if (decision.finalStatus == MarketStatus::Resolved) {
        events_.emit(EventType::MarketResolved,
                     marketId,
                     users,
                     "winner=" + decision.winningOutcome.value_or("") + " method=" + toString(decision.method));
    } else {
        events_.emit(EventType::MarketRefunded,
                     marketId,
                     users,
                     std::string("status=") + toString(decision.finalStatus) + " method=" +
                         toString(decision.method));
    }
    settlement_.announce(report.settlement);
    return Result<ResolutionReport>::success(std::move(report));
}

} // namespace fa
