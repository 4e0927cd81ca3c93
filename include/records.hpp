#pragma once

#include "fixed_point.hpp"
#include "market.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fa {

enum class PositionStatus { Open, Settled, Voided };

struct Position {
    std::string id;
    std::string marketId;
    std::string bettor;
    std::string outcome;
    Fixed64 amountPaid;
    Fixed64 sharesAcquired;
    Fixed64 avgPricePerShare;
    Fixed64 priceAfter;
    Timestamp placedAt;
    // Trade index within the market, in lock-acquisition order.
    std::uint64_t sequence = 0;
    PositionStatus status = PositionStatus::Open;
};

struct ResolutionVote {
    std::string marketId;
    std::string voter;
    std::string chosenOutcome;
    std::uint32_t confidence = 5; // 1..10
    std::uint32_t weight = 1;
    bool isFinal = false;
    Timestamp castAt;
};

enum class ResolutionMethod { AdminDecision, VoteConsensus, Oracle, AutoRefund };

struct Resolution {
    std::string marketId;
    // Empty for refunds and cancellations.
    std::optional<std::string> winningOutcome;
    ResolutionMethod method = ResolutionMethod::AdminDecision;
    MarketStatus finalStatus = MarketStatus::Resolved;
    std::string resolvedBy;
    Timestamp resolvedAt;
    Fixed64 totalPool;
    Fixed64 totalWinningStake;
    Fixed64 totalLosingStake;
    std::uint32_t houseEdgeBps = 0;
    Fixed64 totalFees;
    Fixed64 totalPayout;
    std::uint64_t voteCount = 0;
    std::optional<Timestamp> disputeDeadline;
    std::string evidence;
    std::string liabilityRoot;
};

enum class PayoutKind { Winning, Refund };

struct Payout {
    std::string id;
    std::string marketId;
    std::string positionRef;
    std::string bettor;
    PayoutKind kind = PayoutKind::Winning;
    Fixed64 grossAmount;
    Fixed64 fee;
    Fixed64 netAmount;
};

const char* toString(PositionStatus status);
const char* toString(ResolutionMethod method);
const char* toString(PayoutKind kind);

} // namespace fa
