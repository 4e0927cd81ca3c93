#pragma once

#include "errors.hpp"
#include "fixed_point.hpp"

#include <cstdint>
#include <string>

namespace fa {

struct BuyQuote {
    Fixed64 cashIn;
    Fixed64 sharesOut;
    Fixed64 avgPricePerShare;
    Fixed64 priceBefore;
    Fixed64 priceAfter;
    Fixed64 newCashReserve;
    Fixed64 newShareReserve;
};

// Constant-product curve for a single outcome: shareReserve * cashReserve == k, with k fixed at
// seed time as initialLiquidity^2 (raw units). Buying adds cash and releases shares; the share
// side is rounded up so rounding never leaves the pool short.
class OutcomePool {
public:
    static OutcomePool seed(std::string outcome, Fixed64 initialLiquidity);

    // Rebuilds a pool from persisted reserves. The invariant is not checked here; applyBuy checks
    // it before every mutation.
    static OutcomePool restore(std::string outcome,
                               Fixed64 initialLiquidity,
                               Fixed64 shareReserve,
                               Fixed64 cashReserve,
                               Fixed64 volume,
                               std::uint64_t tradeCount);

    Result<BuyQuote> quoteBuy(Fixed64 cashIn) const;

    // Caller must hold the owning market's execution lock. Returns the shares released, or throws
    // InvariantViolationError when the reserves are outside tolerance before or after the move.
    Result<Fixed64> applyBuy(Fixed64 cashIn, const std::string& marketId);

    Fixed64 impliedPrice() const;

    bool invariantHolds() const;
    // share * cash - k, in raw^2 units.
    __int128 invariantDeviation() const;

    const std::string& outcome() const { return outcome_; }
    Fixed64 initialLiquidity() const { return initialLiquidity_; }
    Fixed64 shareReserve() const { return shareReserve_; }
    Fixed64 cashReserve() const { return cashReserve_; }
    Fixed64 volume() const { return volume_; }
    std::uint64_t tradeCount() const { return tradeCount_; }
    __int128 k() const { return k_; }

private:
    OutcomePool(std::string outcome, Fixed64 initialLiquidity, Fixed64 shareReserve, Fixed64 cashReserve);

    static Fixed64 priceOf(Fixed64 cash, Fixed64 share);

    std::string outcome_;
    Fixed64 initialLiquidity_;
    Fixed64 shareReserve_;
    Fixed64 cashReserve_;
    __int128 k_ = 0;
    Fixed64 volume_;
    std::uint64_t tradeCount_ = 0;
};

} // namespace fa
