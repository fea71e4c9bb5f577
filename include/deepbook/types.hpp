// DeepBook SDK - Core Types
// Fixed-point decimal, protocol enums and integer helpers

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace deepbook {

using I128 = __int128;
using U128 = unsigned __int128;

// Rounding applied whenever a quotient is reduced to an integer
enum class RoundingMode : uint8_t {
    HalfAwayFromZero = 0,
    HalfToEven = 1
};

// Rounding used by every amount and price conversion
inline constexpr RoundingMode AMOUNT_ROUNDING = RoundingMode::HalfAwayFromZero;

// num / den rounded to an integer; den must be non-zero
U128 round_div(U128 num, U128 den, RoundingMode mode = AMOUNT_ROUNDING) noexcept;

// Fixed-point decimal with nine fractional digits
// Stores value as integer * 10^(-9), the display precision of the protocol
class Decimal {
public:
    static constexpr int PRECISION = 9;
    static constexpr int64_t SCALE = 1000000000LL;

    constexpr Decimal() noexcept : value_(0) {}
    constexpr explicit Decimal(I128 scaled) noexcept : value_(scaled) {}

    // Nearest nine-digit value to d
    static Decimal from_double(double d);

    // Parses "[-]digits[.digits]"; extra fractional digits are rounded with AMOUNT_ROUNDING
    static Decimal from_string(std::string_view s);

    static constexpr Decimal from_integer(int64_t whole) noexcept {
        return Decimal(static_cast<I128>(whole) * SCALE);
    }

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(value_) / SCALE;
    }

    // Shortest form, trailing zeros trimmed ("0.1", "12")
    [[nodiscard]] std::string to_string() const;

    // Always nine fractional digits ("0.100000000")
    [[nodiscard]] std::string to_fixed() const;

    [[nodiscard]] constexpr I128 scaled_value() const noexcept { return value_; }

    constexpr Decimal operator+(Decimal rhs) const noexcept {
        return Decimal(value_ + rhs.value_);
    }
    constexpr Decimal operator-(Decimal rhs) const noexcept {
        return Decimal(value_ - rhs.value_);
    }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return Decimal(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    static constexpr Decimal zero() noexcept { return Decimal(0); }
    static constexpr Decimal one() noexcept { return Decimal(SCALE); }

private:
    I128 value_;
};

// Order restriction, encoded as u8 on the wire
enum class OrderType : uint8_t {
    NoRestriction = 0,
    ImmediateOrCancel = 1,
    FillOrKill = 2,
    PostOnly = 3
};

inline constexpr const char* to_string(OrderType t) noexcept {
    switch (t) {
        case OrderType::NoRestriction: return "no_restriction";
        case OrderType::ImmediateOrCancel: return "immediate_or_cancel";
        case OrderType::FillOrKill: return "fill_or_kill";
        case OrderType::PostOnly: return "post_only";
    }
    return "unknown";
}

// Self-matching policy, encoded as u8 on the wire
enum class SelfMatchingOption : uint8_t {
    SelfMatchingAllowed = 0,
    CancelTaker = 1,
    CancelMaker = 2
};

inline constexpr const char* to_string(SelfMatchingOption o) noexcept {
    switch (o) {
        case SelfMatchingOption::SelfMatchingAllowed: return "self_matching_allowed";
        case SelfMatchingOption::CancelTaker: return "cancel_taker";
        case SelfMatchingOption::CancelMaker: return "cancel_maker";
    }
    return "unknown";
}

// Unsigned identifiers supplied as text; throw ParseError on anything but digits
uint64_t parse_u64(std::string_view text, std::string_view what);
U128 parse_u128(std::string_view text, std::string_view what);

std::string u128_to_string(U128 value);

}  // namespace deepbook
