#include "errors.hpp"
#include "outcome_pool.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "outcome_pool_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using fa::Fixed64;
    using fa::OutcomePool;

    // Seeded at 30000: k = 9e8 in whole units, price one half.
    auto pool = OutcomePool::seed("Yes", Fixed64(30'000));
    if (pool.impliedPrice() != *Fixed64::parse("0.5")) {
        fail("seeded price is not 0.5: " + pool.impliedPrice().toString());
    }
    if (!pool.invariantHolds() || pool.invariantDeviation() != 0) {
        fail("seeded pool off the curve");
    }

    auto quote = pool.quoteBuy(Fixed64(1'000));
    if (!quote) {
        fail("quote rejected: " + quote.error().describe());
    }
    // 30000 - ceil(900000000 / 31000) at 8 decimals.
    if (quote.value().sharesOut != *Fixed64::parse("967.74193548")) {
        fail("sharesOut " + quote.value().sharesOut.toString());
    }
    if (quote.value().newShareReserve != *Fixed64::parse("29032.25806452")) {
        fail("newShareReserve " + quote.value().newShareReserve.toString());
    }
    if (quote.value().priceAfter <= *Fixed64::parse("0.5163") ||
        quote.value().priceAfter >= *Fixed64::parse("0.5165")) {
        fail("priceAfter " + quote.value().priceAfter.toString());
    }
    if (pool.cashReserve() != Fixed64(30'000) || pool.tradeCount() != 0) {
        fail("quoteBuy mutated the pool");
    }

    auto shares = pool.applyBuy(Fixed64(1'000), "m-1");
    if (!shares || shares.value() != quote.value().sharesOut) {
        fail("applyBuy disagrees with quoteBuy");
    }
    if (!pool.invariantHolds()) {
        fail("invariant broken after buy");
    }
    Fixed64 firstPrice = pool.impliedPrice();

    // Monotonicity: each further buy of the same outcome raises its price and costs more per share.
    Fixed64 lastAvg = quote.value().avgPricePerShare;
    for (int i = 0; i < 20; ++i) {
        auto next = pool.quoteBuy(Fixed64(1'000));
        if (!next) {
            fail("quote failed at step " + std::to_string(i));
        }
        if (next.value().avgPricePerShare <= lastAvg) {
            fail("average price did not rise at step " + std::to_string(i));
        }
        lastAvg = next.value().avgPricePerShare;
        Fixed64 before = pool.impliedPrice();
        if (!pool.applyBuy(Fixed64(1'000), "m-1")) {
            fail("buy failed at step " + std::to_string(i));
        }
        if (pool.impliedPrice() <= before) {
            fail("price did not rise at step " + std::to_string(i));
        }
        if (!pool.invariantHolds()) {
            fail("invariant broken at step " + std::to_string(i));
        }
    }
    if (pool.impliedPrice() <= firstPrice || pool.tradeCount() != 21 || pool.volume() != Fixed64(21'000)) {
        fail("counters after sequential buys");
    }

    // Independence: buying one outcome leaves another untouched.
    auto other = OutcomePool::seed("No", Fixed64(30'000));
    auto untouched = other;
    if (!pool.applyBuy(Fixed64(500), "m-1")) {
        fail("buy on Yes failed");
    }
    if (other.shareReserve() != untouched.shareReserve() || other.cashReserve() != untouched.cashReserve()) {
        fail("cross-outcome leakage");
    }

    // Small and invalid amounts.
    for (const char* tiny : { "0.00000001", "0.001", "1" }) {
        auto q = other.quoteBuy(*Fixed64::parse(tiny));
        if (q && !q.value().sharesOut.isPositive()) {
            fail(std::string("non-positive shares for ") + tiny);
        }
    }
    if (other.quoteBuy(Fixed64()).kind() != fa::ErrorKind::InvalidAmount) {
        fail("zero amount accepted");
    }
    if (other.quoteBuy(*Fixed64::parse("-5")).kind() != fa::ErrorKind::InvalidAmount) {
        fail("negative amount accepted");
    }

    // Reserves pushed off the curve are refused before any mutation.
    auto corrupt = OutcomePool::restore(
        "Yes", Fixed64(30'000), Fixed64(30'001), Fixed64(30'001), Fixed64(), 0);
    if (corrupt.invariantHolds()) {
        fail("corrupt reserves reported as valid");
    }
    bool threw = false;
    try {
        (void)corrupt.applyBuy(Fixed64(10), "m-2");
    } catch (const fa::InvariantViolationError& ex) {
        threw = ex.marketId() == "m-2" && ex.outcome() == "Yes";
    }
    if (!threw) {
        fail("corrupt pool traded without an invariant violation");
    }
    if (corrupt.cashReserve() != Fixed64(30'001) || corrupt.tradeCount() != 0) {
        fail("corrupt pool mutated");
    }

    threw = false;
    try {
        (void)OutcomePool::seed("Bad", Fixed64());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        fail("zero liquidity accepted");
    }

    std::cout << "outcome_pool_test passed\n";
    return 0;
}
