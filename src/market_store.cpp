#include "market_store.hpp"

#include <mutex>
#include <unordered_map>

namespace fa {

bool InMemoryMarketStore::insertMarket(const Market& market) {
    std::unique_lock lock(mutex_);
    return markets_.emplace(market.id, market).second;
}

std::optional<Market> InMemoryMarketStore::loadMarket(const std::string& marketId) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(marketId);
    if (it == markets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> InMemoryMarketStore::listMarketIds() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(markets_.size());
    for (const auto& [id, market] : markets_) {
        (void)market;
        ids.push_back(id);
    }
    return ids;
}

bool InMemoryMarketStore::commitTrade(const Market& market, const Position& position) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(market.id);
    if (it == markets_.end()) {
        throw StorageError("commitTrade for unknown market " + market.id);
    }
    if (it->second.status != MarketStatus::Active || it->second.halted ||
        it->second.totalTrades + 1 != market.totalTrades) {
        return false;
    }
    it->second = market;
    positions_[market.id].push_back(position);
    return true;
}

bool InMemoryMarketStore::compareAndSaveMarket(const Market& market, MarketStatus expected) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(market.id);
    if (it == markets_.end()) {
        throw StorageError("compareAndSaveMarket for unknown market " + market.id);
    }
    if (it->second.status != expected) {
        return false;
    }
    it->second = market;
    return true;
}

std::vector<Position> InMemoryMarketStore::loadPositions(const std::string& marketId) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(marketId);
    if (it == positions_.end()) {
        return {};
    }
    return it->second;
}

void InMemoryMarketStore::upsertVote(const ResolutionVote& vote) {
    std::unique_lock lock(mutex_);
    if (markets_.find(vote.marketId) == markets_.end()) {
        throw StorageError("vote for unknown market " + vote.marketId);
    }
    votes_[vote.marketId][vote.voter] = vote;
}

std::vector<ResolutionVote> InMemoryMarketStore::loadVotes(const std::string& marketId) const {
    std::shared_lock lock(mutex_);
    std::vector<ResolutionVote> out;
    auto it = votes_.find(marketId);
    if (it == votes_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const auto& [voter, vote] : it->second) {
        (void)voter;
        out.push_back(vote);
    }
    return out;
}

std::optional<Resolution> InMemoryMarketStore::loadResolution(const std::string& marketId) const {
    std::shared_lock lock(mutex_);
    auto it = resolutions_.find(marketId);
    if (it == resolutions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Payout> InMemoryMarketStore::loadPayouts(const std::string& marketId) const {
    std::shared_lock lock(mutex_);
    auto it = payouts_.find(marketId);
    if (it == payouts_.end()) {
        return {};
    }
    return it->second;
}

bool InMemoryMarketStore::commitSettlement(const SettlementBatch& batch, MarketStatus expected) {
    std::unique_lock lock(mutex_);
    const std::string& marketId = batch.market.id;
    auto marketIt = markets_.find(marketId);
    if (marketIt == markets_.end()) {
        throw StorageError("commitSettlement for unknown market " + marketId);
    }
    if (marketIt->second.status != expected) {
        return false;
    }

    // Validate every position reference before touching anything.
    auto& stored = positions_[marketId];
    std::unordered_map<std::string, std::size_t> index;
    index.reserve(stored.size());
    for (std::size_t i = 0; i < stored.size(); ++i) {
        index.emplace(stored[i].id, i);
    }
    for (const auto& position : batch.positions) {
        if (index.find(position.id) == index.end()) {
            throw StorageError("commitSettlement references unknown position " + position.id);
        }
    }
    if (batch.resolution && resolutions_.find(marketId) != resolutions_.end()) {
        throw StorageError("resolution already recorded for market " + marketId);
    }

    marketIt->second = batch.market;
    for (const auto& position : batch.positions) {
        stored[index.at(position.id)] = position;
    }
    if (batch.resolution) {
        resolutions_.emplace(marketId, *batch.resolution);
    }
    auto& payoutLog = payouts_[marketId];
    payoutLog.insert(payoutLog.end(), batch.payouts.begin(), batch.payouts.end());
    return true;
}

} // namespace fa
