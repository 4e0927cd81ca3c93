#include "market_engine.hpp"
#include "market_store.hpp"
#include "settlement.hpp"
#include "test_support.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "settlement_test failure: " << msg << std::endl;
    std::exit(1);
}

// Fails the first settlement commit the way a dropped database connection would.
class FlakyStore : public fa::InMemoryMarketStore {
public:
    bool commitSettlement(const fa::SettlementBatch& batch, fa::MarketStatus expected) override {
        if (failuresLeft > 0) {
            --failuresLeft;
            throw fa::StorageError("connection reset during commit");
        }
        return fa::InMemoryMarketStore::commitSettlement(batch, expected);
    }

    int failuresLeft = 1;
};

struct Bet {
    const char* bettor;
    const char* outcome;
    std::int64_t amount;
};

const std::vector<Bet> kBets = {
    { "alice", "Yes", 1'000 }, { "bob", "No", 700 },   { "carol", "Yes", 333 },
    { "dave", "Yes", 5'000 },  { "erin", "No", 1'250 }, { "frank", "Yes", 17 },
};

std::string marketWithBets(fa::MarketEngine& engine, fa::testing::ManualClock& clock) {
    auto market = engine.createMarket(fa::testing::binaryMarket(clock.now()));
    if (!market) {
        fail("createMarket: " + market.error().describe());
    }
    const std::string id = market.value().id;
    for (const auto& bet : kBets) {
        if (!engine.placeBet(id, bet.outcome, fa::Fixed64(bet.amount), bet.bettor)) {
            fail(std::string("bet from ") + bet.bettor);
        }
    }
    if (!engine.close(id, "ops")) {
        fail("close");
    }
    return id;
}

fa::Fixed64 totalPaid(const std::vector<fa::Position>& positions) {
    fa::Fixed64 total;
    for (const auto& position : positions) {
        total += position.amountPaid;
    }
    return total;
}

fa::Fixed64 totalNet(const std::vector<fa::Payout>& payouts) {
    fa::Fixed64 total;
    for (const auto& payout : payouts) {
        total += payout.netAmount;
    }
    return total;
}

} // namespace

int main() {
    using namespace fa;

    testing::ManualClock clock;

    // Refunds return the stake itself, fee-free.
    {
        MarketEngine engine(EngineConfig{}, nullptr, nullptr, clock.clock());
        const std::string id = marketWithBets(engine, clock);
        auto refunded = engine.refund(id, "ops");
        if (!refunded) {
            fail("refund: " + refunded.error().describe());
        }
        const auto positions = engine.positions(id);
        const auto payouts = engine.payouts(id);
        if (payouts.size() != positions.size()) {
            fail("not every position refunded");
        }
        for (const auto& position : positions) {
            if (position.status != PositionStatus::Voided) {
                fail("refunded position not voided");
            }
            bool found = false;
            for (const auto& payout : payouts) {
                if (payout.positionRef == position.id) {
                    found = payout.kind == PayoutKind::Refund && payout.netAmount == position.amountPaid &&
                            payout.grossAmount == position.amountPaid && payout.fee == Fixed64();
                }
            }
            if (!found) {
                fail("refund amount for " + position.bettor);
            }
        }
        if (refunded.value().settlement.totalNet != totalPaid(positions) ||
            refunded.value().settlement.voidedPositions != positions.size()) {
            fail("refund totals");
        }
    }

    // Par value: each winning share redeems for one unit, less the house edge.
    {
        EngineConfig cfg;
        cfg.houseEdgeBps = 250;
        MarketEngine engine(cfg, nullptr, nullptr, clock.clock());
        const std::string id = marketWithBets(engine, clock);
        auto resolved = engine.resolve(id, std::string("Yes"), "ops");
        if (!resolved) {
            fail("par resolve: " + resolved.error().describe());
        }
        const auto positions = engine.positions(id);
        const auto payouts = engine.payouts(id);
        if (payouts.size() != 4) {
            fail("par payout count");
        }
        for (const auto& position : positions) {
            if (position.status != PositionStatus::Settled) {
                fail("position left open");
            }
            for (const auto& payout : payouts) {
                if (payout.positionRef != position.id) {
                    continue;
                }
                if (position.outcome != "Yes") {
                    fail("loser paid");
                }
                Fixed64 fee = Fixed64::mulDiv(position.sharesAcquired, 250, 10'000, Fixed64::Rounding::Up);
                if (payout.grossAmount != position.sharesAcquired || payout.fee != fee ||
                    payout.netAmount != position.sharesAcquired - fee) {
                    fail("par payout for " + position.bettor);
                }
            }
        }
        if (totalNet(payouts) > totalPaid(positions)) {
            fail("par value paid out more than was paid in");
        }
        if (resolved.value().resolution.totalFees != resolved.value().settlement.totalFees ||
            !resolved.value().resolution.totalFees.isPositive()) {
            fail("fees not recorded");
        }
        if (resolved.value().settlement.liability.totalLiability != totalNet(payouts)) {
            fail("liability snapshot total");
        }

        // Retrying settlement changes nothing.
        auto again = engine.settle(id);
        auto third = engine.settle(id);
        if (!again || !third || !again.value().alreadySettled || !third.value().alreadySettled) {
            fail("retry was not recognised as settled");
        }
        if (again.value().totalNet != resolved.value().settlement.totalNet ||
            third.value().totalNet != again.value().totalNet ||
            again.value().liability.merkleRoot != resolved.value().settlement.liability.merkleRoot ||
            engine.payouts(id).size() != payouts.size()) {
            fail("retry changed the payouts");
        }
        const auto positionsAfter = engine.positions(id);
        for (std::size_t i = 0; i < positions.size(); ++i) {
            if (positionsAfter[i].status != positions[i].status || positionsAfter[i].id != positions[i].id) {
                fail("retry touched a position");
            }
        }
    }

    // Pro-rata: the whole pool goes to winners, exactly, when there is no house edge.
    {
        EngineConfig cfg;
        cfg.payoutPolicy = PayoutPolicy::ProRataPool;
        MarketEngine engine(cfg, nullptr, nullptr, clock.clock());
        const std::string id = marketWithBets(engine, clock);
        if (!engine.resolve(id, std::string("No"), "ops")) {
            fail("pro-rata resolve");
        }
        const auto positions = engine.positions(id);
        const auto payouts = engine.payouts(id);
        if (payouts.size() != 2 || totalNet(payouts) != totalPaid(positions)) {
            fail("pro-rata conservation: paid " + totalPaid(positions).toString() + " net " +
                 totalNet(payouts).toString());
        }
    }
    {
        EngineConfig cfg;
        cfg.payoutPolicy = PayoutPolicy::ProRataPool;
        cfg.houseEdgeBps = 100;
        MarketEngine engine(cfg, nullptr, nullptr, clock.clock());
        const std::string id = marketWithBets(engine, clock);
        auto resolved = engine.resolve(id, std::string("Yes"), "ops");
        if (!resolved) {
            fail("pro-rata resolve with edge");
        }
        const auto positions = engine.positions(id);
        const auto& report = resolved.value().settlement;
        if (!(report.totalNet < totalPaid(positions)) || report.totalNet + report.totalFees != totalPaid(positions)) {
            fail("pro-rata with house edge");
        }
    }
    {
        // Nobody backed the winner: everything settles, nothing is paid.
        EngineConfig cfg;
        cfg.payoutPolicy = PayoutPolicy::ProRataPool;
        MarketEngine engine(cfg, nullptr, nullptr, clock.clock());
        auto market = engine.createMarket(testing::binaryMarket(clock.now()));
        const std::string id = market.value().id;
        if (!engine.placeBet(id, "Yes", Fixed64(100), "alice") || !engine.close(id, "ops")) {
            fail("no-winner setup");
        }
        auto resolved = engine.resolve(id, std::string("No"), "ops");
        if (!resolved || !engine.payouts(id).empty() || engine.positions(id).front().status != PositionStatus::Settled) {
            fail("no-winner settlement");
        }
    }

    // A failed commit leaves nothing behind; the retry settles everything.
    {
        auto store = std::make_shared<FlakyStore>();
        MarketEngine engine(EngineConfig{}, store, nullptr, clock.clock());
        const std::string id = marketWithBets(engine, clock);
        bool threw = false;
        try {
            (void)engine.resolve(id, std::string("Yes"), "ops");
        } catch (const StorageError&) {
            threw = true;
        }
        if (!threw) {
            fail("storage failure swallowed");
        }
        auto state = engine.getMarketState(id);
        if (state.value().status != MarketStatus::Ended || state.value().resolution ||
            !engine.payouts(id).empty()) {
            fail("partial settlement after a failed commit");
        }
        for (const auto& position : engine.positions(id)) {
            if (position.status != PositionStatus::Open) {
                fail("position moved by a failed commit");
            }
        }
        if (!engine.resolve(id, std::string("Yes"), "ops") || engine.payouts(id).size() != 4) {
            fail("retry after failed commit");
        }
    }

    // A terminal market written without its settlement is completed by settle().
    {
        auto store = std::make_shared<InMemoryMarketStore>();
        MarketEngine engine(EngineConfig{}, store, nullptr, clock.clock());
        const std::string id = marketWithBets(engine, clock);
        if (engine.settle(id).kind() != ErrorKind::MarketNotEnded) {
            fail("settled an ended market");
        }
        Market market = *store->loadMarket(id);
        market.status = MarketStatus::Cancelled;
        if (!store->compareAndSaveMarket(market, MarketStatus::Ended)) {
            fail("could not cancel behind the engine");
        }
        auto settled = engine.settle(id);
        if (!settled || settled.value().alreadySettled || settled.value().payouts.size() != kBets.size()) {
            fail("settle did not complete the cancellation");
        }
        auto again = engine.settle(id);
        if (!again || !again.value().alreadySettled || engine.payouts(id).size() != kBets.size()) {
            fail("second settle paid again");
        }
    }

    // Liability snapshot binds recipients and amounts.
    {
        Payout a;
        a.positionRef = "p1";
        a.bettor = "alice";
        a.netAmount = Fixed64(10);
        Payout b = a;
        b.positionRef = "p2";
        b.bettor = "bob";
        b.netAmount = Fixed64(5);
        Payout c = a;
        c.positionRef = "p3";
        c.netAmount = Fixed64(1);

        auto first = SettlementEngine::snapshotLiabilities({ a, b, c });
        auto second = SettlementEngine::snapshotLiabilities({ a, b, c });
        if (first.merkleRoot != second.merkleRoot || first.totalLiability != Fixed64(16)) {
            fail("snapshot not deterministic");
        }
        c.netAmount = Fixed64(2);
        if (SettlementEngine::snapshotLiabilities({ a, b, c }).merkleRoot == first.merkleRoot) {
            fail("snapshot ignores amounts");
        }
        if (!SettlementEngine::snapshotLiabilities({}).merkleRoot.empty()) {
            fail("empty snapshot");
        }
    }

    std::cout << "settlement_test passed\n";
    return 0;
}
