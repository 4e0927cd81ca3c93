#include "deterministic_math.hpp"
#include "engine_config.hpp"
#include "outcome_pool.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// Prints the price impact of single buys of increasing size against a freshly seeded pool, then
// the price path of repeated equal buys.
int main(int argc, char** argv) {
    fa::EngineConfig cfg;
    try {
        cfg = fa::loadEngineConfig();
    } catch (const std::exception& ex) {
        std::cerr << "configuration error: " << ex.what() << "\n";
        return 1;
    }

    fa::Fixed64 liquidity = cfg.defaultInitialLiquidity;
    if (argc > 1) {
        auto parsed = fa::Fixed64::parse(argv[1]);
        if (!parsed || !parsed->isPositive()) {
            std::cerr << "usage: quote_curve [initial-liquidity] [step-amount]\n";
            return 1;
        }
        liquidity = *parsed;
    }
    fa::Fixed64 step(1000);
    if (argc > 2) {
        auto parsed = fa::Fixed64::parse(argv[2]);
        if (!parsed || !parsed->isPositive()) {
            std::cerr << "usage: quote_curve [initial-liquidity] [step-amount]\n";
            return 1;
        }
        step = *parsed;
    }

    const auto pool = fa::OutcomePool::seed("yes", liquidity);

    std::cout << "=== SINGLE BUY IMPACT ===\n";
    std::cout << "Initial liquidity: " << liquidity.toString() << "  start price: " << pool.impliedPrice().toString()
              << "\n\n";
    std::cout << std::setw(18) << std::left << "amount" << std::setw(18) << "shares" << std::setw(14)
              << "avg price" << std::setw(14) << "price after" << "impact bps\n";

    const std::vector<std::int64_t> sizes = { 1, 10, 100, 1'000, 5'000, 10'000, 30'000, 100'000, 1'000'000 };
    for (auto size : sizes) {
        fa::Fixed64 amount(size);
        if (amount < cfg.minBet || amount > cfg.maxBet) {
            continue;
        }
        auto quote = pool.quoteBuy(amount);
        if (!quote) {
            std::cout << std::setw(18) << amount.toString() << quote.error().message << "\n";
            continue;
        }
        const auto& q = quote.value();
        std::cout << std::setw(18) << amount.toString() << std::setw(18) << q.sharesOut.toString() << std::setw(14)
                  << q.avgPricePerShare.toString() << std::setw(14) << q.priceAfter.toString()
                  << fa::DeterministicMath::changeBps(q.priceBefore, q.priceAfter) << "\n";
    }

    std::cout << "\n=== REPEATED BUYS OF " << step.toString() << " ===\n";
    auto path = pool;
    for (int i = 1; i <= 10; ++i) {
        auto shares = path.applyBuy(step, "quote-curve");
        if (!shares) {
            std::cout << "  buy " << i << ": " << shares.error().message << "\n";
            break;
        }
        std::cout << "  buy " << std::setw(3) << i << " shares=" << std::setw(16) << shares.value().toString()
                  << " price=" << path.impliedPrice().toString() << "\n";
    }

    return 0;
}
