// DeepBook SDK - Types Implementation

#include <deepbook/types.hpp>
#include <deepbook/errors.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>

namespace deepbook {

namespace {

// Largest whole part a Decimal accepts from text
constexpr size_t MAX_WHOLE_DIGITS = 26;

// Fractional digits considered when rescaling; keeps frac * SCALE within 128 bits
constexpr size_t MAX_FRACTION_DIGITS = 27;

bool all_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

std::string digits_of(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out += static_cast<char>('0' + static_cast<int>(value % 10));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

}  // namespace

U128 round_div(U128 num, U128 den, RoundingMode mode) noexcept {
    U128 quotient = num / den;
    U128 remainder = num % den;
    U128 twice = remainder * 2;

    if (twice > den) return quotient + 1;
    if (twice < den) return quotient;

    // Exact tie
    if (mode == RoundingMode::HalfAwayFromZero) return quotient + 1;
    return (quotient % 2 == 0) ? quotient : quotient + 1;
}

// Decimal implementation
Decimal Decimal::from_double(double d) {
    if (!std::isfinite(d)) {
        throw ParseError("Decimal value is not finite");
    }
    double scaled = std::round(d * SCALE);
    if (std::fabs(scaled) >= 9.2e18) {
        throw AmountOverflowError("Decimal value out of range: " + std::to_string(d));
    }
    return Decimal(static_cast<I128>(static_cast<int64_t>(scaled)));
}

Decimal Decimal::from_string(std::string_view s) {
    std::string_view body = s;
    bool negative = false;
    if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
        negative = body[0] == '-';
        body.remove_prefix(1);
    }

    auto dot = body.find('.');
    std::string_view int_part = body.substr(0, dot);
    std::string_view frac_part = dot == std::string_view::npos
        ? std::string_view{}
        : body.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw ParseError("Invalid decimal: '" + std::string(s) + "'");
    }
    if ((!int_part.empty() && !all_digits(int_part)) ||
        (!frac_part.empty() && !all_digits(frac_part)) ||
        (dot != std::string_view::npos && body.size() == 1)) {
        throw ParseError("Invalid decimal: '" + std::string(s) + "'");
    }
    if (int_part.size() > MAX_WHOLE_DIGITS) {
        throw AmountOverflowError("Decimal out of range: '" + std::string(s) + "'");
    }

    U128 whole = 0;
    for (char c : int_part) whole = whole * 10 + static_cast<U128>(c - '0');

    // Collect fractional digits as an integer over 10^len, then rescale to PRECISION
    U128 frac = 0;
    U128 frac_den = 1;
    for (size_t i = 0; i < frac_part.size() && i < MAX_FRACTION_DIGITS; ++i) {
        frac = frac * 10 + static_cast<U128>(frac_part[i] - '0');
        frac_den *= 10;
    }
    U128 frac_scaled = round_div(frac * static_cast<U128>(SCALE), frac_den);

    U128 magnitude = whole * static_cast<U128>(SCALE) + frac_scaled;
    I128 value = static_cast<I128>(magnitude);
    return Decimal(negative ? -value : value);
}

std::string Decimal::to_fixed() const {
    U128 abs_val = static_cast<U128>(value_ < 0 ? -value_ : value_);
    U128 int_part = abs_val / static_cast<U128>(SCALE);
    U128 frac_part = abs_val % static_cast<U128>(SCALE);

    std::string result;
    if (value_ < 0) result += '-';
    result += digits_of(int_part);
    result += '.';

    std::string frac_str = digits_of(frac_part);
    result += std::string(PRECISION - frac_str.size(), '0');
    result += frac_str;
    return result;
}

std::string Decimal::to_string() const {
    std::string result = to_fixed();

    // Trim trailing zeros after decimal point
    size_t last_non_zero = result.find_last_not_of('0');
    if (last_non_zero != std::string::npos && result[last_non_zero] == '.') {
        last_non_zero--;
    }
    return result.substr(0, last_non_zero + 1);
}

uint64_t parse_u64(std::string_view text, std::string_view what) {
    if (!all_digits(text)) {
        throw ParseError("Invalid " + std::string(what) + ": '" + std::string(text) +
                         "' is not an unsigned integer");
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw ParseError("Invalid " + std::string(what) + ": '" + std::string(text) +
                         "' does not fit in 64 bits");
    }
    return value;
}

U128 parse_u128(std::string_view text, std::string_view what) {
    if (!all_digits(text)) {
        throw ParseError("Invalid " + std::string(what) + ": '" + std::string(text) +
                         "' is not an unsigned integer");
    }
    constexpr U128 max = ~static_cast<U128>(0);
    U128 value = 0;
    for (char c : text) {
        U128 digit = static_cast<U128>(c - '0');
        if (value > (max - digit) / 10) {
            throw ParseError("Invalid " + std::string(what) + ": '" + std::string(text) +
                             "' does not fit in 128 bits");
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string u128_to_string(U128 value) {
    return digits_of(value);
}

}  // namespace deepbook
