#pragma once

#include "fixed_point.hpp"

#include <vector>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace fa {

class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;

    // num / den rounded to the nearest Fixed64 raw unit (ties away from zero).
    static Fixed64 ratio(__int128 num, __int128 den);

    // Rescales non-negative weights so the result sums to exactly one whole unit. Leftover raw
    // units from truncation go to the largest remainders, lowest index first on ties.
    static std::vector<Fixed64> normalize(const std::vector<Fixed64>& weights);

    // Relative change (after - before) / before, in basis points.
    static std::int64_t changeBps(Fixed64 before, Fixed64 after);

private:
    static HighPrecision toHighPrecision(__int128 value);
};

} // namespace fa
