#include "trade_executor.hpp"

#include "deterministic_math.hpp"
#include "secure_random.hpp"

#include <utility>

namespace fa {

TradeExecutor::TradeExecutor(MarketStore& store,
                             MarketLockTable& locks,
                             EventPublisher& events,
                             AuditTrail& audit,
                             const EngineConfig& cfg,
                             Clock clock)
    : store_(store), locks_(locks), events_(events), audit_(audit), cfg_(cfg), clock_(std::move(clock)) {}

std::optional<EngineError> TradeExecutor::validateAmount(Fixed64 cashIn) const {
    if (!cashIn.isPositive()) {
        return EngineError{ ErrorKind::InvalidAmount, "amount must be positive" };
    }
    if (cashIn < cfg_.minBet || cashIn > cfg_.maxBet) {
        return EngineError{ ErrorKind::AmountOutOfBounds,
                            "amount must be between " + cfg_.minBet.toString() + " and " +
                                cfg_.maxBet.toString() };
    }
    return std::nullopt;
}

Result<Position> TradeExecutor::placeBet(const std::string& marketId,
                                         const std::string& outcome,
                                         Fixed64 cashIn,
                                         const std::string& bettor) {
    if (auto invalid = validateAmount(cashIn)) {
        return Result<Position>::failure(*invalid);
    }

    Position position;
    try {
        auto guard = locks_.tryAcquire(marketId, cfg_.lockTimeout);
        if (!guard) {
            return Result<Position>::failure(ErrorKind::MarketBusy,
                                             "market " + marketId + " is busy, retry the bet");
        }

        auto market = store_.loadMarket(marketId);
        if (!market) {
            return Result<Position>::failure(ErrorKind::MarketNotFound, "unknown market " + marketId);
        }
        if (market->halted) {
            return Result<Position>::failure(ErrorKind::MarketHalted,
                                             "market " + marketId + " is halted pending review");
        }
        if (market->status != MarketStatus::Active) {
            return Result<Position>::failure(ErrorKind::MarketNotActive,
                                             std::string("market is ") + toString(market->status));
        }
        const Timestamp now = clock_();
        if (now >= market->endTime) {
            return Result<Position>::failure(ErrorKind::MarketEnded, "betting closed at end time");
        }
        OutcomePool* pool = market->pool(outcome);
        if (pool == nullptr) {
            return Result<Position>::failure(ErrorKind::InvalidOutcome,
                                             "\"" + outcome + "\" is not an outcome of this market");
        }

        Fixed64 shares;
        try {
            auto applied = pool->applyBuy(cashIn, marketId);
            if (!applied) {
                return Result<Position>::failure(applied.error());
            }
            shares = applied.value();
        } catch (const InvariantViolationError& ex) {
            haltMarket(marketId, ex);
            throw;
        }

        market->totalVolume += cashIn;
        ++market->totalTrades;

        position.id = newRecordId();
        position.marketId = marketId;
        position.bettor = bettor;
        position.outcome = outcome;
        position.amountPaid = cashIn;
        position.sharesAcquired = shares;
        position.avgPricePerShare = cashIn / shares;
        position.priceAfter = pool->impliedPrice();
        position.placedAt = now;
        position.sequence = market->totalTrades;

        if (!store_.commitTrade(*market, position)) {
            return Result<Position>::failure(ErrorKind::MarketNotActive,
                                             "market changed while the trade was in flight");
        }

        AuditRecord record;
        record.kind = AuditKind::TradeExecuted;
        record.timestampMs = toEpochMillis(now);
        record.sequence = position.sequence;
        record.amountRaw = cashIn.raw();
        record.sharesRaw = shares.raw();
        record.marketId = marketId;
        record.actor = bettor;
        record.outcome = outcome;
        record.status = toString(market->status);
        record.detail = position.id;
        audit_.record(record);
    } catch (const InvariantViolationError& ex) {
        events_.emit(EventType::InvariantViolation, ex.marketId(), {}, ex.what());
        throw;
    }

    events_.emit(EventType::TradeExecuted,
                 marketId,
                 { bettor },
                 "outcome=" + outcome + " amount=" + cashIn.toString() +
                     " shares=" + position.sharesAcquired.toString() +
                     " price=" + position.priceAfter.toString());
    return Result<Position>::success(std::move(position));
}

void TradeExecutor::haltMarket(const std::string& marketId, const InvariantViolationError& error) {
    // Reload so the halted record keeps the reserves exactly as they were found.
    auto market = store_.loadMarket(marketId);
    if (!market) {
        return;
    }
    market->halted = true;
    if (!store_.compareAndSaveMarket(*market, market->status)) {
        throw StorageError("unable to halt market " + marketId);
    }

    AuditRecord record;
    record.kind = AuditKind::InvariantViolation;
    record.timestampMs = toEpochMillis(clock_());
    record.marketId = marketId;
    record.outcome = error.outcome();
    record.status = toString(market->status);
    record.detail = error.what();
    audit_.record(record);
}

Result<TradeQuote> TradeExecutor::quote(const std::string& marketId,
                                        const std::string& outcome,
                                        Fixed64 cashIn) const {
    if (auto invalid = validateAmount(cashIn)) {
        return Result<TradeQuote>::failure(*invalid);
    }
    auto market = store_.loadMarket(marketId);
    if (!market) {
        return Result<TradeQuote>::failure(ErrorKind::MarketNotFound, "unknown market " + marketId);
    }
    if (market->halted) {
        return Result<TradeQuote>::failure(ErrorKind::MarketHalted, "market " + marketId + " is halted");
    }
    if (market->status != MarketStatus::Active) {
        return Result<TradeQuote>::failure(ErrorKind::MarketNotActive,
                                           std::string("market is ") + toString(market->status));
    }
    if (clock_() >= market->endTime) {
        return Result<TradeQuote>::failure(ErrorKind::MarketEnded, "betting closed at end time");
    }
    const OutcomePool* pool = market->pool(outcome);
    if (pool == nullptr) {
        return Result<TradeQuote>::failure(ErrorKind::InvalidOutcome,
                                           "\"" + outcome + "\" is not an outcome of this market");
    }

    auto buy = pool->quoteBuy(cashIn);
    if (!buy) {
        return Result<TradeQuote>::failure(buy.error());
    }
    TradeQuote out;
    out.marketId = marketId;
    out.outcome = outcome;
    out.quote = buy.value();
    out.priceImpactBps = DeterministicMath::changeBps(out.quote.priceBefore, out.quote.priceAfter);
    return Result<TradeQuote>::success(std::move(out));
}

} // namespace fa
