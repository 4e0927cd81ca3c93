#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace fa {

// Deterministic fixed-point amount. Every cash, share and price quantity in the engine is one of
// these; nothing on the pricing path touches floating point.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 100'000'000; // 8 fractional digits
    static constexpr int kDecimals = 8;
    static constexpr std::int64_t kMaxWhole =
        std::numeric_limits<std::int64_t>::max() / kScale;
    static constexpr std::int64_t kMinWhole =
        std::numeric_limits<std::int64_t>::min() / kScale;

    enum class Rounding { Down, Up };

    Fixed64() : raw_(0) {}
    explicit Fixed64(std::int64_t whole) : raw_(scaleWhole(whole)) {}
    static Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }

    // Exact decimal parse: "12", "-0.5", "1000.12345678". More than 8 fractional digits is
    // rejected rather than rounded.
    static std::optional<Fixed64> parse(const std::string& text) {
        if (text.empty()) {
            return std::nullopt;
        }
        std::size_t pos = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            pos = 1;
        }
        __int128 whole = 0;
        __int128 frac = 0;
        int fracDigits = 0;
        bool seenDigit = false;
        bool seenPoint = false;
        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.') {
                if (seenPoint) {
                    return std::nullopt;
                }
                seenPoint = true;
                continue;
            }
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            seenDigit = true;
            if (seenPoint) {
                if (++fracDigits > kDecimals) {
                    return std::nullopt;
                }
                frac = frac * 10 + (c - '0');
            } else {
                whole = whole * 10 + (c - '0');
                if (whole > kMaxWhole) {
                    return std::nullopt;
                }
            }
        }
        if (!seenDigit) {
            return std::nullopt;
        }
        for (int i = fracDigits; i < kDecimals; ++i) {
            frac *= 10;
        }
        __int128 raw = whole * kScale + frac;
        if (negative) {
            raw = -raw;
        }
        if (raw > std::numeric_limits<std::int64_t>::max() ||
            raw < std::numeric_limits<std::int64_t>::min()) {
            return std::nullopt;
        }
        return Fixed64(static_cast<std::int64_t>(raw), RawTag{});
    }

    std::int64_t raw() const { return raw_; }
    bool isPositive() const { return raw_ > 0; }

    std::string toString() const {
        __int128 value = raw_;
        bool negative = value < 0;
        if (negative) {
            value = -value;
        }
        auto whole = static_cast<unsigned long long>(value / kScale);
        auto frac = static_cast<unsigned long long>(value % kScale);
        std::string fracText = std::to_string(frac);
        fracText.insert(0, static_cast<std::size_t>(kDecimals) - fracText.size(), '0');
        return (negative ? "-" : "") + std::to_string(whole) + "." + fracText;
    }

    Fixed64 operator+(Fixed64 other) const {
        return Fixed64(checked(static_cast<__int128>(raw_) + other.raw_), RawTag{});
    }
    Fixed64 operator-(Fixed64 other) const {
        return Fixed64(checked(static_cast<__int128>(raw_) - other.raw_), RawTag{});
    }

    // Truncates toward zero.
    Fixed64 operator*(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(other.raw_);
        return Fixed64(checked(wide / kScale), RawTag{});
    }

    Fixed64 operator/(Fixed64 other) const { return divide(other, Rounding::Down); }

    Fixed64 divide(Fixed64 other, Rounding mode) const {
        if (other.raw_ == 0) {
            throw std::domain_error("Fixed64 division by zero");
        }
        __int128 num = static_cast<__int128>(raw_) * static_cast<__int128>(kScale);
        return Fixed64(checked(divideRounded(num, other.raw_, mode)), RawTag{});
    }

    // value * num / den with a single rounding step; used for basis-point fees and pro-rata
    // splits where the intermediate product exceeds 64 bits.
    static Fixed64 mulDiv(Fixed64 value, std::int64_t num, std::int64_t den, Rounding mode) {
        if (den == 0) {
            throw std::domain_error("Fixed64 mulDiv by zero");
        }
        __int128 wide = static_cast<__int128>(value.raw_) * static_cast<__int128>(num);
        return Fixed64(checked(divideRounded(wide, den, mode)), RawTag{});
    }

    static __int128 divideRounded(__int128 num, __int128 den, Rounding mode) {
        if (den < 0) {
            num = -num;
            den = -den;
        }
        __int128 q = num / den;
        __int128 r = num % den;
        if (r != 0) {
            if (mode == Rounding::Up && num > 0) {
                ++q;
            } else if (mode == Rounding::Down && num < 0) {
                --q;
            }
        }
        return q;
    }

    Fixed64& operator+=(Fixed64 other) {
        raw_ = checked(static_cast<__int128>(raw_) + other.raw_);
        return *this;
    }

    Fixed64& operator-=(Fixed64 other) {
        raw_ = checked(static_cast<__int128>(raw_) - other.raw_);
        return *this;
    }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator>(Fixed64 other) const { return raw_ > other.raw_; }
    bool operator<=(Fixed64 other) const { return raw_ <= other.raw_; }
    bool operator>=(Fixed64 other) const { return raw_ >= other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    struct RawTag {};
    explicit Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}

    static std::int64_t checked(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max()) ||
            value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            throw std::overflow_error("Fixed64 arithmetic overflow");
        }
        return static_cast<std::int64_t>(value);
    }

    static std::int64_t scaleWhole(std::int64_t whole) {
        if (whole > kMaxWhole || whole < kMinWhole) {
            throw std::overflow_error("Fixed64 whole value out of range");
        }
        __int128 wide = static_cast<__int128>(whole) * static_cast<__int128>(kScale);
        return static_cast<std::int64_t>(wide);
    }

    std::int64_t raw_;
};

} // namespace fa
