#pragma once

#include "fixed_point.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fa {

// Cross-outcome price display. Curves are always independent; Normalized only rescales the
// reported prices so they sum to one.
enum class PricePolicy { Independent, Normalized };

// ParValue redeems each winning share for one unit. ProRataPool splits the whole market volume
// among winning shares.
enum class PayoutPolicy { ParValue, ProRataPool };

// Hard bounds on outcomes per market; maxOutcomes may narrow but never widen them.
constexpr std::size_t kMinOutcomes = 2;
constexpr std::size_t kOutcomeLimit = 10;

struct EngineConfig {
    Fixed64 minBet = Fixed64(1);
    Fixed64 maxBet = Fixed64(1'000'000);
    Fixed64 defaultInitialLiquidity = Fixed64(30'000);
    std::uint32_t houseEdgeBps = 0;
    std::uint32_t minResolutionVotes = 2;
    std::size_t maxOutcomes = 10;
    std::chrono::milliseconds lockTimeout{ 250 };
    std::chrono::minutes minMarketDuration{ 5 };
    std::chrono::hours maxMarketDuration{ 720 };
    std::chrono::hours autoRefundAfter{ 120 };
    std::chrono::hours disputeWindow{ 24 };
    PricePolicy pricePolicy = PricePolicy::Independent;
    PayoutPolicy payoutPolicy = PayoutPolicy::ParValue;

    // Throws std::runtime_error describing the first inconsistent setting.
    void validate() const;
};

// Overlays FA_* environment variables onto base and validates the result.
//   FA_MIN_BET, FA_MAX_BET, FA_INITIAL_LIQUIDITY     decimal amounts
//   FA_HOUSE_EDGE_BPS, FA_MIN_RESOLUTION_VOTES, FA_MAX_OUTCOMES
//   FA_LOCK_TIMEOUT_MS, FA_MIN_DURATION_MINUTES, FA_MAX_DURATION_HOURS
//   FA_AUTO_REFUND_HOURS, FA_DISPUTE_WINDOW_HOURS
//   FA_PRICE_POLICY   independent | normalized
//   FA_PAYOUT_POLICY  par | pro-rata
EngineConfig loadEngineConfig(const EngineConfig& base = EngineConfig{});

const char* toString(PricePolicy policy);
const char* toString(PayoutPolicy policy);

} // namespace fa
