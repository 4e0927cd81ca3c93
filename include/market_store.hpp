#pragma once

#include "market.hpp"
#include "records.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace fa {

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything a terminal transition writes, committed as one unit.
struct SettlementBatch {
    Market market;
    std::optional<Resolution> resolution;
    std::vector<Position> positions;
    std::vector<Payout> payouts;
};

// Boundary to the persistent store. Implementations give snapshot reads and atomic commits; the
// engine serializes writers per market id, so the compare steps below only catch writers that
// bypass the engine.
class MarketStore {
public:
    virtual ~MarketStore() = default;

    // False when the id is taken.
    virtual bool insertMarket(const Market& market) = 0;
    virtual std::optional<Market> loadMarket(const std::string& marketId) const = 0;
    virtual std::vector<std::string> listMarketIds() const = 0;

    // Writes the market (reserves, counters) and appends the position. False when the stored
    // market is no longer Active or another trade landed first.
    virtual bool commitTrade(const Market& market, const Position& position) = 0;

    // Replaces the market record if its stored status still equals expected.
    virtual bool compareAndSaveMarket(const Market& market, MarketStatus expected) = 0;

    virtual std::vector<Position> loadPositions(const std::string& marketId) const = 0;

    // Unique on (marketId, voter); a second vote from the same voter replaces the first.
    virtual void upsertVote(const ResolutionVote& vote) = 0;
    virtual std::vector<ResolutionVote> loadVotes(const std::string& marketId) const = 0;

    virtual std::optional<Resolution> loadResolution(const std::string& marketId) const = 0;
    virtual std::vector<Payout> loadPayouts(const std::string& marketId) const = 0;

    // All-or-none: market, resolution (first write only), updated positions and payouts. False
    // when the stored status no longer equals expected.
    virtual bool commitSettlement(const SettlementBatch& batch, MarketStatus expected) = 0;
};

class InMemoryMarketStore : public MarketStore {
public:
    bool insertMarket(const Market& market) override;
    std::optional<Market> loadMarket(const std::string& marketId) const override;
    std::vector<std::string> listMarketIds() const override;
    bool commitTrade(const Market& market, const Position& position) override;
    bool compareAndSaveMarket(const Market& market, MarketStatus expected) override;
    std::vector<Position> loadPositions(const std::string& marketId) const override;
    void upsertVote(const ResolutionVote& vote) override;
    std::vector<ResolutionVote> loadVotes(const std::string& marketId) const override;
    std::optional<Resolution> loadResolution(const std::string& marketId) const override;
    std::vector<Payout> loadPayouts(const std::string& marketId) const override;
    bool commitSettlement(const SettlementBatch& batch, MarketStatus expected) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Market> markets_;
    std::unordered_map<std::string, std::vector<Position>> positions_;
    std::unordered_map<std::string, std::map<std::string, ResolutionVote>> votes_;
    std::unordered_map<std::string, Resolution> resolutions_;
    std::unordered_map<std::string, std::vector<Payout>> payouts_;
};

} // namespace fa
