#include "market_engine.hpp"

#include "deterministic_math.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace fa {

namespace {

EngineConfig validated(EngineConfig cfg) {
    cfg.validate();
    return cfg;
}

} // namespace

MarketEngine::MarketEngine(EngineConfig cfg, std::shared_ptr<MarketStore> store, EventSinkPtr sink, Clock clock)
    : cfg_(validated(std::move(cfg))),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      store_(store ? std::move(store) : std::make_shared<InMemoryMarketStore>()),
      events_(std::move(sink)),
      settlement_(*store_, locks_, events_, audit_, cfg_, clock_),
      executor_(*store_, locks_, events_, audit_, cfg_, clock_),
      resolver_(*store_, locks_, events_, audit_, settlement_, cfg_, clock_) {}

Result<Market> MarketEngine::createMarket(const MarketDefinition& definition) {
    const Timestamp now = clock_();
    auto created = Market::create(newRecordId(), definition, now, cfg_);
    if (!created) {
        return created;
    }
    const Market& market = created.value();
    if (!store_->insertMarket(market)) {
        throw StorageError("market id collision on " + market.id);
    }

    AuditRecord record;
    record.kind = AuditKind::MarketCreated;
    record.timestampMs = toEpochMillis(now);
    record.amountRaw = market.initialLiquidity.raw();
    record.marketId = market.id;
    record.actor = market.creator;
    record.status = toString(market.status);
    record.detail = market.question;
    audit_.record(record);
    return created;
}

Result<Position> MarketEngine::placeBet(const std::string& marketId,
                                        const std::string& outcome,
                                        Fixed64 amount,
                                        const std::string& bettor) {
    return executor_.placeBet(marketId, outcome, amount, bettor);
}

Result<TradeQuote> MarketEngine::getQuote(const std::string& marketId,
                                          const std::string& outcome,
                                          Fixed64 amount) const {
    return executor_.quote(marketId, outcome, amount);
}

Result<ResolutionVote> MarketEngine::castVote(const VoteRequest& request) {
    return resolver_.castVote(request);
}

Result<ResolutionReport> MarketEngine::resolve(const std::string& marketId,
                                               const std::optional<std::string>& outcome,
                                               const std::string& resolvedBy) {
    if (outcome) {
        return resolver_.adminResolve(marketId, *outcome, resolvedBy);
    }
    return resolver_.attemptResolve(marketId, resolvedBy);
}

Result<ResolutionReport> MarketEngine::resolveFromOracle(const std::string& marketId, const std::string& resolvedBy) {
    OraclePtr oracle = oracle_;
    if (!oracle) {
        return Result<ResolutionReport>::failure(ErrorKind::OracleUnavailable, "no oracle configured");
    }
    return resolver_.resolveFromOracle(marketId, *oracle, resolvedBy);
}

Result<ResolutionReport> MarketEngine::refund(const std::string& marketId, const std::string& requestedBy) {
    return resolver_.refund(marketId, requestedBy, ResolutionMethod::AdminDecision);
}

Result<ResolutionReport> MarketEngine::cancel(const std::string& marketId, const std::string& requestedBy) {
    return resolver_.cancel(marketId, requestedBy);
}

Result<Market> MarketEngine::pause(const std::string& marketId, const std::string& actor) {
    return changeStatus(marketId, { MarketStatus::Active }, MarketStatus::Paused, actor);
}

Result<Market> MarketEngine::resume(const std::string& marketId, const std::string& actor) {
    return changeStatus(marketId, { MarketStatus::Paused }, MarketStatus::Active, actor);
}

Result<Market> MarketEngine::close(const std::string& marketId, const std::string& actor) {
    return changeStatus(marketId, { MarketStatus::Active, MarketStatus::Paused }, MarketStatus::Ended, actor);
}

Result<Market> MarketEngine::changeStatus(const std::string& marketId,
                                          std::initializer_list<MarketStatus> from,
                                          MarketStatus next,
                                          const std::string& actor) {
    auto guard = locks_.tryAcquire(marketId, cfg_.lockTimeout);
    if (!guard) {
        return Result<Market>::failure(ErrorKind::MarketBusy, "market " + marketId + " is locked by another operation");
    }
    auto market = store_->loadMarket(marketId);
    if (!market) {
        return Result<Market>::failure(ErrorKind::MarketNotFound, "unknown market " + marketId);
    }
    const MarketStatus prior = market->status;
    if (isTerminal(prior)) {
        return Result<Market>::failure(ErrorKind::MarketFinalized, std::string("market is already ") + toString(prior));
    }
    if (prior == MarketStatus::Ended) {
        return Result<Market>::failure(ErrorKind::MarketEnded, "market has already ended");
    }

    const Timestamp now = clock_();
    if (next == MarketStatus::Active && now >= market->endTime) {
        next = MarketStatus::Ended;
    }
    if (!market->transition(from, next)) {
        return Result<Market>::failure(ErrorKind::MarketNotActive,
                                       std::string("cannot move a ") + toString(prior) + " market to " +
                                           toString(next));
    }
    if (!store_->compareAndSaveMarket(*market, prior)) {
        return Result<Market>::failure(ErrorKind::MarketFinalized, "market status changed concurrently");
    }

    AuditRecord record;
    record.kind = AuditKind::StatusChanged;
    record.timestampMs = toEpochMillis(now);
    record.marketId = marketId;
    record.actor = actor;
    record.status = toString(next);
    record.detail = std::string(toString(prior)) + "->" + toString(next);
    audit_.record(record);
    return Result<Market>::success(std::move(*market));
}

Result<SettlementReport> MarketEngine::settle(const std::string& marketId) {
    return settlement_.settle(marketId);
}

SweepSummary MarketEngine::sweep() {
    SweepSummary summary;
    const Timestamp now = clock_();
    for (const auto& id : store_->listMarketIds()) {
        auto market = store_->loadMarket(id);
        if (!market || isTerminal(market->status)) {
            continue;
        }

        if ((market->status == MarketStatus::Active || market->status == MarketStatus::Paused) &&
            now >= market->endTime) {
            auto closed = changeStatus(id, { MarketStatus::Active, MarketStatus::Paused }, MarketStatus::Ended, "sweep");
            if (closed) {
                ++summary.ended;
            } else if (closed.kind() == ErrorKind::MarketBusy) {
                ++summary.busy;
                continue;
            }
            market = store_->loadMarket(id);
        }

        if (market && market->status == MarketStatus::Ended && now >= market->refundDeadline(cfg_)) {
            auto refunded = resolver_.refund(id, "sweep", ResolutionMethod::AutoRefund);
            if (refunded) {
                ++summary.refunded;
            } else if (refunded.kind() == ErrorKind::MarketBusy) {
                ++summary.busy;
            }
        }
    }
    locks_.prune();
    return summary;
}

Result<MarketState> MarketEngine::getMarketState(const std::string& marketId) const {
    auto market = store_->loadMarket(marketId);
    if (!market) {
        return Result<MarketState>::failure(ErrorKind::MarketNotFound, "unknown market " + marketId);
    }

    MarketState state;
    state.id = market->id;
    state.question = market->question;
    state.creator = market->creator;
    state.status = market->status;
    state.halted = market->halted;
    state.settlementComplete = market->settlementComplete;
    state.createdAt = market->createdAt;
    state.endTime = market->endTime;
    state.refundDeadline = market->refundDeadline(cfg_);
    state.initialLiquidity = market->initialLiquidity;
    state.totalVolume = market->totalVolume;
    state.totalTrades = market->totalTrades;
    state.winningOutcome = market->winningOutcome;

    std::vector<Fixed64> prices;
    prices.reserve(market->pools.size());
    for (const auto& pool : market->pools) {
        prices.push_back(pool.impliedPrice());
    }
    const std::vector<Fixed64> display =
        (cfg_.pricePolicy == PricePolicy::Normalized) ? DeterministicMath::normalize(prices) : prices;

    for (std::size_t i = 0; i < market->pools.size(); ++i) {
        const OutcomePool& pool = market->pools[i];
        OutcomeState outcome;
        outcome.outcome = pool.outcome();
        outcome.shareReserve = pool.shareReserve();
        outcome.cashReserve = pool.cashReserve();
        outcome.impliedPrice = prices[i];
        outcome.displayPrice = display[i];
        outcome.volume = pool.volume();
        outcome.tradeCount = pool.tradeCount();
        state.outcomes.push_back(std::move(outcome));
    }
    state.resolution = store_->loadResolution(marketId);
    return Result<MarketState>::success(std::move(state));
}

std::vector<std::string> MarketEngine::marketIds() const {
    return store_->listMarketIds();
}

std::vector<Position> MarketEngine::positions(const std::string& marketId) const {
    auto out = store_->loadPositions(marketId);
    std::stable_sort(out.begin(), out.end(), [](const Position& a, const Position& b) {
        return a.sequence < b.sequence;
    });
    return out;
}

std::vector<Payout> MarketEngine::payouts(const std::string& marketId) const {
    return store_->loadPayouts(marketId);
}

void MarketEngine::setOracle(OraclePtr oracle) {
    oracle_ = std::move(oracle);
}

void MarketEngine::setEventSink(EventSinkPtr sink) {
    events_.setSink(std::move(sink));
}

std::size_t MarketEngine::flushEvents() {
    return events_.flush();
}

std::size_t MarketEngine::pendingEvents() const {
    return events_.pendingCount();
}

std::string MarketEngine::auditRoot() const {
    return audit_.root();
}

} // namespace fa
