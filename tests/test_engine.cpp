#include "audit_trail.hpp"
#include "engine_config.hpp"
#include "market_engine.hpp"
#include "test_support.hpp"
#include "transcript_log.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "engine_test failure: " << msg << std::endl;
    std::exit(1);
}

// Sink that fails with something other than a std::exception.
class ThrowingSink : public fa::EventSink {
public:
    void publish(const fa::MarketEvent&) override { throw 42; }
};

// Sink that calls back into the engine while an event is being delivered.
class ReentrantSink : public fa::EventSink {
public:
    void publish(const fa::MarketEvent& event) override {
        ++delivered;
        if (engine != nullptr) {
            pendingSeen = engine->pendingEvents();
            nestedFlush = engine->flushEvents();
        }
        (void)event;
    }

    fa::MarketEngine* engine = nullptr;
    int delivered = 0;
    std::size_t pendingSeen = 0;
    std::size_t nestedFlush = 99;
};

// Full recomputation of the transcript root, level by level.
std::string recomputeRoot(std::vector<std::string> layer) {
    if (layer.empty()) {
        return {};
    }
    while (layer.size() > 1) {
        std::vector<std::string> next;
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(fa::sha256Hex(layer[i] + right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

} // namespace

int main() {
    using namespace fa;
    using namespace std::chrono_literals;

    testing::ManualClock clock;
    auto sink = std::make_shared<testing::RecordingSink>();
    MarketEngine engine(EngineConfig{}, nullptr, sink, clock.clock());

    // Sweep closes expired markets, then refunds those nobody resolved in time.
    auto first = engine.createMarket(testing::binaryMarket(clock.now(), 60min));
    auto second = engine.createMarket(testing::binaryMarket(clock.now(), 120min));
    if (!first || !second) {
        fail("createMarket");
    }
    const std::string a = first.value().id;
    const std::string b = second.value().id;
    if (!engine.placeBet(a, "Yes", Fixed64(100), "alice") || !engine.placeBet(b, "No", Fixed64(40), "bob")) {
        fail("seed bets");
    }

    auto idle = engine.sweep();
    if (idle.ended != 0 || idle.refunded != 0) {
        fail("sweep touched live markets");
    }

    clock.advance(90min);
    auto swept = engine.sweep();
    if (swept.ended != 1 || swept.refunded != 0 || engine.getMarketState(a).value().status != MarketStatus::Ended ||
        engine.getMarketState(b).value().status != MarketStatus::Active) {
        fail("first sweep");
    }

    // Past a's refund deadline (end + 120h) but not b's.
    clock.advance(120h);
    swept = engine.sweep();
    if (swept.ended != 1 || swept.refunded != 1) {
        fail("second sweep: ended=" + std::to_string(swept.ended) + " refunded=" + std::to_string(swept.refunded));
    }
    auto refunded = engine.getMarketState(a);
    if (refunded.value().status != MarketStatus::Refunded || !refunded.value().resolution ||
        refunded.value().resolution->method != ResolutionMethod::AutoRefund) {
        fail("auto refund");
    }
    if (engine.payouts(a).size() != 1 || engine.payouts(a).front().netAmount != Fixed64(100)) {
        fail("auto refund payout");
    }
    if (engine.getMarketState(b).value().status != MarketStatus::Ended) {
        fail("b not ended");
    }

    // A market with its own resolution deadline is refunded at that deadline.
    auto withDeadline = testing::binaryMarket(clock.now(), 60min);
    withDeadline.resolutionDeadline = withDeadline.endTime + 2h;
    auto c = engine.createMarket(withDeadline);
    if (!c) {
        fail("market with deadline");
    }
    clock.advance(3h + 1min);
    swept = engine.sweep();
    if (engine.getMarketState(c.value().id).value().status != MarketStatus::Refunded) {
        fail("resolution deadline ignored");
    }

    // Event sequence numbers increase; failed deliveries wait for flush.
    auto events = sink->events();
    for (std::size_t i = 1; i < events.size(); ++i) {
        if (events[i].sequence <= events[i - 1].sequence) {
            fail("event sequence not increasing");
        }
    }
    auto d = engine.createMarket(testing::binaryMarket(clock.now()));
    if (!d) {
        fail("market d");
    }
    const std::size_t delivered = sink->events().size();
    sink->failing = true;
    if (!engine.placeBet(d.value().id, "Yes", Fixed64(5), "carol") ||
        !engine.placeBet(d.value().id, "No", Fixed64(5), "dave")) {
        fail("bets while the sink is down");
    }
    if (engine.pendingEvents() != 2 || sink->events().size() != delivered) {
        fail("undelivered events not queued");
    }
    if (engine.flushEvents() != 0 || engine.pendingEvents() != 2) {
        fail("flush delivered to a failing sink");
    }
    sink->failing = false;
    if (engine.flushEvents() != 2 || engine.pendingEvents() != 0) {
        fail("flush did not redeliver");
    }
    auto redelivered = sink->events();
    if (redelivered.size() != delivered + 2 || redelivered[delivered].userIds.front() != "carol" ||
        redelivered[delivered + 1].sequence <= redelivered[delivered].sequence) {
        fail("redelivery order");
    }

    // A sink throwing a non-standard exception never fails a committed trade.
    {
        MarketEngine guarded(EngineConfig{}, nullptr, std::make_shared<ThrowingSink>(), clock.clock());
        auto market = guarded.createMarket(testing::binaryMarket(clock.now()));
        if (!market) {
            fail("market for throwing sink");
        }
        Result<Position> placed = Result<Position>::failure(ErrorKind::MarketBusy, "not run");
        try {
            placed = guarded.placeBet(market.value().id, "Yes", Fixed64(100), "alice");
        } catch (...) {
            fail("sink exception escaped placeBet");
        }
        if (!placed || guarded.positions(market.value().id).size() != 1) {
            fail("trade not reported as committed");
        }
        if (guarded.pendingEvents() != 1 || guarded.events().deliveryFailures() != 1 ||
            guarded.events().lastDeliveryError() != "unknown exception") {
            fail("undeliverable event not queued for redelivery");
        }
    }

    // The sink may call back into the engine without deadlocking.
    {
        auto reentrant = std::make_shared<ReentrantSink>();
        MarketEngine nested(EngineConfig{}, nullptr, reentrant, clock.clock());
        reentrant->engine = &nested;
        auto market = nested.createMarket(testing::binaryMarket(clock.now()));
        if (!market || !nested.placeBet(market.value().id, "No", Fixed64(10), "bob")) {
            fail("bet with reentrant sink");
        }
        if (reentrant->delivered != 1 || reentrant->pendingSeen != 1 || reentrant->nestedFlush != 0 ||
            nested.pendingEvents() != 0) {
            fail("reentrant delivery");
        }
        reentrant->engine = nullptr;
    }

    // Cached transcript levels agree with a full recomputation at every size.
    {
        TranscriptLog log;
        if (!log.merkleRoot().empty()) {
            fail("empty transcript root");
        }
        for (int n = 1; n <= 17; ++n) {
            log.append("record-" + std::to_string(n));
            if (log.merkleRoot() != recomputeRoot(log.getLeaves())) {
                fail("transcript root diverged at " + std::to_string(n) + " leaves");
            }
            for (std::size_t i = 0; i < log.size(); ++i) {
                if (!TranscriptLog::verifyProof(log.getLeaves()[i], i, log.size(), log.merkleProof(i), log.merkleRoot())) {
                    fail("transcript proof " + std::to_string(i) + " of " + std::to_string(n));
                }
            }
        }
    }

    // Every audit record is provable against the root.
    const AuditTrail& audit = engine.audit();
    const auto leaves = audit.leaves();
    if (leaves.empty() || audit.root() != engine.auditRoot()) {
        fail("empty audit trail");
    }
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        if (!TranscriptLog::verifyProof(leaves[i], i, leaves.size(), audit.proof(i), audit.root())) {
            fail("audit proof " + std::to_string(i));
        }
    }

    AuditRecord record;
    record.kind = AuditKind::Settled;
    record.timestampMs = 42;
    record.amountRaw = -7;
    record.marketId = "m";
    record.liabilityRoot = "root";
    record.detail = "two payouts";
    AuditRecord decoded;
    if (!decodeAuditRecord(encodeAuditRecord(record), decoded) || decoded.kind != AuditKind::Settled ||
        decoded.amountRaw != -7 || decoded.detail != "two payouts" || decoded.liabilityRoot != "root") {
        fail("audit record codec");
    }
    if (decodeAuditRecord(encodeAuditRecord(record).substr(0, 10), decoded)) {
        fail("truncated audit record accepted");
    }

    // Normalized display prices sum to one; curve prices do not have to.
    EngineConfig normalized;
    normalized.pricePolicy = PricePolicy::Normalized;
    MarketEngine display(normalized, nullptr, nullptr, clock.clock());
    auto three = testing::binaryMarket(clock.now());
    three.outcomes = { "Red", "Green", "Blue" };
    auto m = display.createMarket(three);
    if (!m || !display.placeBet(m.value().id, "Red", Fixed64(2'000), "erin")) {
        fail("three-way market");
    }
    auto state = display.getMarketState(m.value().id);
    std::int64_t displaySum = 0;
    std::int64_t curveSum = 0;
    for (const auto& outcome : state.value().outcomes) {
        displaySum += outcome.displayPrice.raw();
        curveSum += outcome.impliedPrice.raw();
    }
    if (displaySum != Fixed64::kScale || curveSum == Fixed64::kScale) {
        fail("normalized display prices");
    }

    // Environment overlay.
    setenv("FA_HOUSE_EDGE_BPS", "150", 1);
    setenv("FA_PAYOUT_POLICY", " pro-rata ", 1);
    setenv("FA_MIN_BET", "0.5", 1);
    EngineConfig loaded = loadEngineConfig();
    if (loaded.houseEdgeBps != 150 || loaded.payoutPolicy != PayoutPolicy::ProRataPool ||
        loaded.minBet != *Fixed64::parse("0.5")) {
        fail("environment overlay");
    }
    setenv("FA_PRICE_POLICY", "sideways", 1);
    bool threw = false;
    try {
        (void)loadEngineConfig();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        fail("invalid FA_PRICE_POLICY accepted");
    }
    unsetenv("FA_PRICE_POLICY");
    setenv("FA_MAX_OUTCOMES", "50", 1);
    threw = false;
    try {
        (void)loadEngineConfig();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        fail("FA_MAX_OUTCOMES above ten accepted");
    }
    unsetenv("FA_MAX_OUTCOMES");
    unsetenv("FA_HOUSE_EDGE_BPS");
    unsetenv("FA_PAYOUT_POLICY");
    unsetenv("FA_MIN_BET");

    std::cout << "engine_test passed\n";
    return 0;
}
