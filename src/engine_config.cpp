#include "engine_config.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace fa {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

Fixed64 envAmount(const char* name, Fixed64 fallback) {
    auto value = readEnv(name);
    if (!value) {
        return fallback;
    }
    auto parsed = Fixed64::parse(*value);
    if (!parsed) {
        throw std::runtime_error(std::string(name) + " must be a decimal amount, got \"" + *value + "\"");
    }
    return *parsed;
}

std::uint64_t envUnsigned(const char* name, std::uint64_t fallback) {
    auto value = readEnv(name);
    if (!value) {
        return fallback;
    }
    if (value->find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(std::string(name) + " must be an unsigned integer, got \"" + *value + "\"");
    }
    try {
        return std::stoull(*value);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(name) + " is out of range: " + ex.what());
    }
}

std::uint32_t envUnsigned32(const char* name, std::uint32_t fallback) {
    std::uint64_t value = envUnsigned(name, fallback);
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error(std::string(name) + " is out of range");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

void EngineConfig::validate() const {
    if (!minBet.isPositive()) {
        throw std::runtime_error("Minimum bet amount must be positive");
    }
    if (!maxBet.isPositive()) {
        throw std::runtime_error("Maximum bet amount must be positive");
    }
    if (minBet >= maxBet) {
        throw std::runtime_error("Minimum bet amount must be less than maximum bet amount");
    }
    if (!defaultInitialLiquidity.isPositive()) {
        throw std::runtime_error("Initial liquidity must be positive");
    }
    if (houseEdgeBps > 10'000) {
        throw std::runtime_error("House edge cannot exceed 10000 basis points");
    }
    if (minResolutionVotes == 0) {
        throw std::runtime_error("At least one resolution vote must be required");
    }
    if (maxOutcomes < kMinOutcomes) {
        throw std::runtime_error("Markets need room for at least two outcomes");
    }
    if (maxOutcomes > kOutcomeLimit) {
        throw std::runtime_error("Markets allow at most " + std::to_string(kOutcomeLimit) + " outcomes");
    }
    if (lockTimeout.count() <= 0) {
        throw std::runtime_error("Market lock timeout must be positive");
    }
    if (minMarketDuration.count() < 0 ||
        std::chrono::duration_cast<std::chrono::minutes>(maxMarketDuration) <= minMarketDuration) {
        throw std::runtime_error("Maximum market duration must exceed the minimum duration");
    }
    if (autoRefundAfter.count() <= 0) {
        throw std::runtime_error("Auto-refund window must be positive");
    }
    if (disputeWindow.count() < 0) {
        throw std::runtime_error("Dispute window cannot be negative");
    }
}

EngineConfig loadEngineConfig(const EngineConfig& base) {
    EngineConfig cfg = base;
    cfg.minBet = envAmount("FA_MIN_BET", cfg.minBet);
    cfg.maxBet = envAmount("FA_MAX_BET", cfg.maxBet);
    cfg.defaultInitialLiquidity = envAmount("FA_INITIAL_LIQUIDITY", cfg.defaultInitialLiquidity);
    cfg.houseEdgeBps = envUnsigned32("FA_HOUSE_EDGE_BPS", cfg.houseEdgeBps);
    cfg.minResolutionVotes = envUnsigned32("FA_MIN_RESOLUTION_VOTES", cfg.minResolutionVotes);
    cfg.maxOutcomes = static_cast<std::size_t>(envUnsigned("FA_MAX_OUTCOMES", cfg.maxOutcomes));
    cfg.lockTimeout = std::chrono::milliseconds(
        envUnsigned("FA_LOCK_TIMEOUT_MS", static_cast<std::uint64_t>(cfg.lockTimeout.count())));
    cfg.minMarketDuration = std::chrono::minutes(
        envUnsigned("FA_MIN_DURATION_MINUTES", static_cast<std::uint64_t>(cfg.minMarketDuration.count())));
    cfg.maxMarketDuration = std::chrono::hours(
        envUnsigned("FA_MAX_DURATION_HOURS", static_cast<std::uint64_t>(cfg.maxMarketDuration.count())));
    cfg.autoRefundAfter = std::chrono::hours(
        envUnsigned("FA_AUTO_REFUND_HOURS", static_cast<std::uint64_t>(cfg.autoRefundAfter.count())));
    cfg.disputeWindow = std::chrono::hours(
        envUnsigned("FA_DISPUTE_WINDOW_HOURS", static_cast<std::uint64_t>(cfg.disputeWindow.count())));

    if (auto policy = readEnv("FA_PRICE_POLICY")) {
        if (*policy == "independent") {
            cfg.pricePolicy = PricePolicy::Independent;
        } else if (*policy == "normalized") {
            cfg.pricePolicy = PricePolicy::Normalized;
        } else {
            throw std::runtime_error("FA_PRICE_POLICY must be \"independent\" or \"normalized\"");
        }
    }
    if (auto policy = readEnv("FA_PAYOUT_POLICY")) {
        if (*policy == "par") {
            cfg.payoutPolicy = PayoutPolicy::ParValue;
        } else if (*policy == "pro-rata") {
            cfg.payoutPolicy = PayoutPolicy::ProRataPool;
        } else {
            throw std::runtime_error("FA_PAYOUT_POLICY must be \"par\" or \"pro-rata\"");
        }
    }

    cfg.validate();
    return cfg;
}

const char* toString(PricePolicy policy) {
    return policy == PricePolicy::Normalized ? "normalized" : "independent";
}

const char* toString(PayoutPolicy policy) {
    return policy == PayoutPolicy::ProRataPool ? "pro-rata" : "par";
}

} // namespace fa
