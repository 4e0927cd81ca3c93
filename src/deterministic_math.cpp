#include "deterministic_math.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace fa {

DeterministicMath::HighPrecision DeterministicMath::toHighPrecision(__int128 value) {
    // cpp_dec_float has no __int128 constructor; split into two 64-bit halves.
    bool negative = value < 0;
    unsigned __int128 magnitude =
        negative ? static_cast<unsigned __int128>(-(value + 1)) + 1 : static_cast<unsigned __int128>(value);
    auto high = static_cast<std::uint64_t>(magnitude >> 64);
    auto low = static_cast<std::uint64_t>(magnitude);
    HighPrecision out = HighPrecision(high) * HighPrecision("18446744073709551616") + HighPrecision(low);
    return negative ? -out : out;
}

Fixed64 DeterministicMath::ratio(__int128 num, __int128 den) {
    if (den == 0) {
        throw std::domain_error("DeterministicMath::ratio with zero denominator");
    }
    HighPrecision scaled =
        toHighPrecision(num) * HighPrecision(Fixed64::kScale) / toHighPrecision(den);
    HighPrecision rounded = boost::multiprecision::round(scaled);
    if (rounded > HighPrecision(std::numeric_limits<std::int64_t>::max()) ||
        rounded < HighPrecision(std::numeric_limits<std::int64_t>::min())) {
        throw std::overflow_error("DeterministicMath::ratio result out of range");
    }
    return Fixed64::fromRaw(rounded.convert_to<std::int64_t>());
}

std::vector<Fixed64> DeterministicMath::normalize(const std::vector<Fixed64>& weights) {
    std::vector<Fixed64> out(weights.size());
    if (weights.empty()) {
        return out;
    }

    __int128 total = 0;
    for (const auto& w : weights) {
        if (w.raw() < 0) {
            throw std::domain_error("Cannot normalize negative weights");
        }
        total += w.raw();
    }
    if (total == 0) {
        throw std::domain_error("Cannot normalize an all-zero weight vector");
    }

    std::vector<HighPrecision> remainders(weights.size());
    std::int64_t assigned = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        HighPrecision exact =
            toHighPrecision(weights[i].raw()) * HighPrecision(Fixed64::kScale) / toHighPrecision(total);
        HighPrecision floored = boost::multiprecision::floor(exact);
        remainders[i] = exact - floored;
        std::int64_t raw = floored.convert_to<std::int64_t>();
        out[i] = Fixed64::fromRaw(raw);
        assigned += raw;
    }

    std::vector<std::size_t> order(weights.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return remainders[a] > remainders[b];
    });

    std::int64_t leftover = Fixed64::kScale - assigned;
    for (std::size_t i = 0; leftover > 0; i = (i + 1) % order.size(), --leftover) {
        out[order[i]] += Fixed64::fromRaw(1);
    }
    return out;
}

std::int64_t DeterministicMath::changeBps(Fixed64 before, Fixed64 after) {
    if (before.raw() == 0) {
        throw std::domain_error("changeBps with zero baseline");
    }
    HighPrecision delta = HighPrecision(after.raw()) - HighPrecision(before.raw());
    HighPrecision bps = delta * HighPrecision(10'000) / HighPrecision(before.raw());
    return boost::multiprecision::round(bps).convert_to<std::int64_t>();
}

} // namespace fa
