#include "settlement.hpp"

#include "secure_random.hpp"
#include "transcript_log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fa {

SettlementEngine::SettlementEngine(MarketStore& store,
                                   MarketLockTable& locks,
                                   EventPublisher& events,
                                   AuditTrail& audit,
                                   const EngineConfig& cfg,
                                   Clock clock)
    : store_(store), locks_(locks), events_(events), audit_(audit), cfg_(cfg), clock_(std::move(clock)) {}

SettlementBatch SettlementEngine::prepare(const Market& market,
                                          const std::vector<Position>& positions) const {
    SettlementBatch batch;
    batch.market = market;
    batch.market.settlementComplete = true;

    switch (market.status) {
    case MarketStatus::Resolved:
        settleResolved(market, positions, batch);
        break;
    case MarketStatus::Refunded:
    case MarketStatus::Cancelled:
        settleRefund(positions, batch);
        break;
    default:
        throw std::logic_error("settlement prepared for non-terminal market " + market.id);
    }
    return batch;
}

Payout SettlementEngine::makePayout(const Position& position,
                                    PayoutKind kind,
                                    Fixed64 gross,
                                    Fixed64 fee) const {
    Payout payout;
    payout.id = newRecordId();
    payout.marketId = position.marketId;
    payout.positionRef = position.id;
    payout.bettor = position.bettor;
    payout.kind = kind;
    payout.grossAmount = gross;
    payout.fee = fee;
    payout.netAmount = gross - fee;
    return payout;
}

void SettlementEngine::settleResolved(const Market& market,
                                      const std::vector<Position>& positions,
                                      SettlementBatch& batch) const {
    if (!market.winningOutcome) {
        throw std::logic_error("resolved market " + market.id + " has no winning outcome");
    }
    const std::string& winner = *market.winningOutcome;

    // Gross per winning position id. Pro-rata shares are computed over every winning position,
    // settled or not, so a retry reproduces the same split.
    std::vector<const Position*> winners;
    for (const auto& position : positions) {
        if (position.outcome == winner) {
            winners.push_back(&position);
        }
    }
    std::stable_sort(winners.begin(), winners.end(), [](const Position* a, const Position* b) {
        return a->sequence < b->sequence;
    });

    std::vector<Fixed64> gross(winners.size());
    if (cfg_.payoutPolicy == PayoutPolicy::ParValue) {
        for (std::size_t i = 0; i < winners.size(); ++i) {
            // Each winning share redeems at one unit.
            gross[i] = winners[i]->sharesAcquired;
        }
    } else {
        __int128 totalShares = 0;
        for (const auto* position : winners) {
            totalShares += position->sharesAcquired.raw();
        }
        if (totalShares > 0) {
            const __int128 pool = market.totalVolume.raw();
            std::vector<__int128> remainders(winners.size());
            __int128 assigned = 0;
            for (std::size_t i = 0; i < winners.size(); ++i) {
                __int128 exact = pool * winners[i]->sharesAcquired.raw();
                __int128 base = exact / totalShares;
                remainders[i] = exact % totalShares;
                gross[i] = Fixed64::fromRaw(static_cast<std::int64_t>(base));
                assigned += base;
            }
            std::vector<std::size_t> order(winners.size());
            for (std::size_t i = 0; i < order.size(); ++i) {
                order[i] = i;
            }
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                return remainders[a] > remainders[b];
            });
            __int128 leftover = pool - assigned;
            for (std::size_t i = 0; leftover > 0; i = (i + 1) % order.size(), --leftover) {
                gross[order[i]] += Fixed64::fromRaw(1);
            }
        }
    }

    for (std::size_t i = 0; i < winners.size(); ++i) {
        if (winners[i]->status != PositionStatus::Open) {
            continue;
        }
        Fixed64 fee = Fixed64::mulDiv(gross[i], cfg_.houseEdgeBps, 10'000, Fixed64::Rounding::Up);
        batch.payouts.push_back(makePayout(*winners[i], PayoutKind::Winning, gross[i], fee));
    }

    for (const auto& position : positions) {
        if (position.status != PositionStatus::Open) {
            continue;
        }
        Position updated = position;
        updated.status = PositionStatus::Settled;
        batch.positions.push_back(std::move(updated));
    }
}

void SettlementEngine::settleRefund(const std::vector<Position>& positions,
                                    SettlementBatch& batch) const {
    for (const auto& position : positions) {
        if (position.status != PositionStatus::Open) {
            continue;
        }
        // Refunds return the stake itself, never the share value, and carry no fee.
        batch.payouts.push_back(makePayout(position, PayoutKind::Refund, position.amountPaid, Fixed64()));
        Position updated = position;
        updated.status = PositionStatus::Voided;
        batch.positions.push_back(std::move(updated));
    }
}

Result<SettlementReport> SettlementEngine::settle(const std::string& marketId) {
    SettlementReport report;
    {
        auto guard = locks_.tryAcquire(marketId, cfg_.lockTimeout);
        if (!guard) {
            return Result<SettlementReport>::failure(ErrorKind::MarketBusy,
                                                     "market " + marketId + " is locked by another operation");
        }

        auto market = store_.loadMarket(marketId);
        if (!market) {
            return Result<SettlementReport>::failure(ErrorKind::MarketNotFound, "unknown market " + marketId);
        }
        if (!isTerminal(market->status)) {
            return Result<SettlementReport>::failure(
                ErrorKind::MarketNotEnded,
                std::string("cannot settle a market that is ") + toString(market->status));
        }

        if (market->settlementComplete) {
            report = summarize(*market, store_.loadPositions(marketId), store_.loadPayouts(marketId));
            report.alreadySettled = true;
            return Result<SettlementReport>::success(std::move(report));
        }

        SettlementBatch batch = prepare(*market, store_.loadPositions(marketId));
        if (!store_.commitSettlement(batch, market->status)) {
            return Result<SettlementReport>::failure(ErrorKind::MarketFinalized,
                                                     "market status changed during settlement");
        }
        report = summarize(batch.market, store_.loadPositions(marketId), store_.loadPayouts(marketId));

        AuditRecord record;
        record.kind = AuditKind::Settled;
        record.timestampMs = toEpochMillis(clock_());
        record.amountRaw = report.totalNet.raw();
        record.feeRaw = report.totalFees.raw();
        record.marketId = marketId;
        record.actor = "settlement-retry";
        record.status = toString(batch.market.status);
        record.liabilityRoot = report.liability.merkleRoot;
        audit_.record(record);
    }

    announce(report);
    return Result<SettlementReport>::success(std::move(report));
}

SettlementReport SettlementEngine::summarize(const Market& market,
                                             const std::vector<Position>& positions,
                                             const std::vector<Payout>& payouts) const {
    SettlementReport report;
    report.marketId = market.id;
    report.status = market.status;
    report.winningOutcome = market.winningOutcome;
    report.payouts = payouts;
    for (const auto& position : positions) {
        report.totalPaidIn += position.amountPaid;
        if (position.status == PositionStatus::Settled) {
            ++report.settledPositions;
        } else if (position.status == PositionStatus::Voided) {
            ++report.voidedPositions;
        }
    }
    for (const auto& payout : payouts) {
        report.totalGross += payout.grossAmount;
        report.totalFees += payout.fee;
        report.totalNet += payout.netAmount;
    }
    report.liability = snapshotLiabilities(payouts);
    return report;
}

void SettlementEngine::announce(const SettlementReport& report) {
    for (const auto& payout : report.payouts) {
        if (!payout.netAmount.isPositive()) {
            continue;
        }
        events_.emit(EventType::PayoutReady,
                     report.marketId,
                     { payout.bettor },
                     std::string(toString(payout.kind)) + " position=" + payout.positionRef +
                         " net=" + payout.netAmount.toString());
    }
}

LiabilityProof SettlementEngine::snapshotLiabilities(const std::vector<Payout>& payouts) {
    struct Node {
        std::string hash;
        Fixed64 sum;
    };

    std::vector<Node> layer;
    layer.reserve(payouts.size());
    for (const auto& payout : payouts) {
        Node leaf;
        leaf.sum = payout.netAmount;
        leaf.hash = sha256Hex(payout.positionRef + ":" + payout.bettor + ":" + payout.netAmount.toString());
        layer.push_back(std::move(leaf));
    }

    if (layer.empty()) {
        return {};
    }

    const Node empty{ sha256Hex(""), Fixed64() };
    auto combine = [](const Node& left, const Node& right) {
        Node out;
        out.sum = left.sum + right.sum;
        out.hash = sha256Hex(left.hash + "|" + right.hash + "|" + out.sum.toString());
        return out;
    };

    while (layer.size() > 1) {
        std::vector<Node> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            next.push_back(combine(layer[i], (i + 1 < layer.size()) ? layer[i + 1] : empty));
        }
        layer = std::move(next);
    }

    LiabilityProof proof;
    proof.merkleRoot = layer.front().hash;
    proof.totalLiability = layer.front().sum;
    return proof;
}

} // namespace fa
