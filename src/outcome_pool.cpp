#include "outcome_pool.hpp"

#include "deterministic_math.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace fa {

namespace {

__int128 ceilDiv(__int128 num, __int128 den) {
    return Fixed64::divideRounded(num, den, Fixed64::Rounding::Up);
}

} // namespace

OutcomePool::OutcomePool(std::string outcome,
                         Fixed64 initialLiquidity,
                         Fixed64 shareReserve,
                         Fixed64 cashReserve)
    : outcome_(std::move(outcome)),
      initialLiquidity_(initialLiquidity),
      shareReserve_(shareReserve),
      cashReserve_(cashReserve),
      k_(static_cast<__int128>(initialLiquidity.raw()) * static_cast<__int128>(initialLiquidity.raw())) {}

OutcomePool OutcomePool::seed(std::string outcome, Fixed64 initialLiquidity) {
    if (!initialLiquidity.isPositive()) {
        throw std::invalid_argument("Initial liquidity must be positive");
    }
    return OutcomePool(std::move(outcome), initialLiquidity, initialLiquidity, initialLiquidity);
}

OutcomePool OutcomePool::restore(std::string outcome,
                                 Fixed64 initialLiquidity,
                                 Fixed64 shareReserve,
                                 Fixed64 cashReserve,
                                 Fixed64 volume,
                                 std::uint64_t tradeCount) {
    OutcomePool pool(std::move(outcome), initialLiquidity, shareReserve, cashReserve);
    pool.volume_ = volume;
    pool.tradeCount_ = tradeCount;
    return pool;
}

Fixed64 OutcomePool::priceOf(Fixed64 cash, Fixed64 share) {
    __int128 total = static_cast<__int128>(cash.raw()) + static_cast<__int128>(share.raw());
    return DeterministicMath::ratio(cash.raw(), total);
}

Result<BuyQuote> OutcomePool::quoteBuy(Fixed64 cashIn) const {
    if (!cashIn.isPositive()) {
        return Result<BuyQuote>::failure(ErrorKind::InvalidAmount, "amount must be positive");
    }
    if (cashIn.raw() > std::numeric_limits<std::int64_t>::max() - cashReserve_.raw()) {
        return Result<BuyQuote>::failure(ErrorKind::InvalidAmount, "amount exceeds pool capacity");
    }

    Fixed64 newCash = cashReserve_ + cashIn;
    Fixed64 newShare = Fixed64::fromRaw(static_cast<std::int64_t>(ceilDiv(k_, newCash.raw())));
    Fixed64 sharesOut = shareReserve_ - newShare;
    if (!sharesOut.isPositive()) {
        return Result<BuyQuote>::failure(ErrorKind::InvalidAmount,
                                         "amount too small to acquire any shares");
    }

    BuyQuote quote;
    quote.cashIn = cashIn;
    quote.sharesOut = sharesOut;
    quote.avgPricePerShare = cashIn / sharesOut;
    quote.priceBefore = impliedPrice();
    quote.priceAfter = priceOf(newCash, newShare);
    quote.newCashReserve = newCash;
    quote.newShareReserve = newShare;
    return Result<BuyQuote>::success(quote);
}

Result<Fixed64> OutcomePool::applyBuy(Fixed64 cashIn, const std::string& marketId) {
    if (!invariantHolds()) {
        throw InvariantViolationError(marketId, outcome_, "reserves out of tolerance before trade");
    }

    auto quote = quoteBuy(cashIn);
    if (!quote) {
        return Result<Fixed64>::failure(quote.error());
    }

    cashReserve_ = quote.value().newCashReserve;
    shareReserve_ = quote.value().newShareReserve;
    volume_ += cashIn;
    ++tradeCount_;

    if (!invariantHolds()) {
        throw InvariantViolationError(marketId, outcome_, "reserves out of tolerance after trade");
    }
    return Result<Fixed64>::success(quote.value().sharesOut);
}

Fixed64 OutcomePool::impliedPrice() const {
    return priceOf(cashReserve_, shareReserve_);
}

__int128 OutcomePool::invariantDeviation() const {
    return static_cast<__int128>(shareReserve_.raw()) * static_cast<__int128>(cashReserve_.raw()) - k_;
}

bool OutcomePool::invariantHolds() const {
    if (!shareReserve_.isPositive() || !cashReserve_.isPositive()) {
        return false;
    }
    // Rounding the share side up overshoots k by less than one share unit times the cash reserve.
    __int128 deviation = invariantDeviation();
    return deviation >= 0 && deviation < static_cast<__int128>(cashReserve_.raw());
}

} // namespace fa
