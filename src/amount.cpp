// DeepBook SDK - Amount Conversion Implementation

#include <deepbook/amount.hpp>
#include <deepbook/errors.hpp>
#include <limits>
#include <string>

namespace deepbook {

namespace {

constexpr U128 U64_MAX = std::numeric_limits<uint64_t>::max();
constexpr U128 U128_MAX = ~static_cast<U128>(0);
constexpr U128 I128_MAX = U128_MAX >> 1;

U128 checked_mul(U128 a, U128 b, const char* what) {
    if (a != 0 && b > U128_MAX / a) {
        throw AmountOverflowError(std::string(what) + " overflows 128-bit intermediate");
    }
    return a * b;
}

U128 magnitude(Decimal value, const char* what) {
    if (value.is_negative()) {
        throw AmountOverflowError(std::string(what) + " must not be negative: " + value.to_string());
    }
    return static_cast<U128>(value.scaled_value());
}

uint64_t narrow(U128 value, const char* what) {
    if (value > U64_MAX) {
        throw AmountOverflowError(std::string(what) + " " + u128_to_string(value) +
                                  " exceeds u64 range");
    }
    return static_cast<uint64_t>(value);
}

void require_scalar(uint64_t scalar) {
    if (scalar == 0) {
        throw ConfigError("Coin scalar must be non-zero");
    }
}

}  // namespace

uint64_t to_units(Decimal amount, uint64_t scalar) {
    require_scalar(scalar);
    U128 num = checked_mul(magnitude(amount, "Amount"), scalar, "Amount");
    return narrow(round_div(num, Decimal::SCALE), "Amount");
}

uint64_t to_units(Decimal amount, const Coin& coin) {
    return to_units(amount, coin.scalar);
}

Decimal to_decimal(uint64_t units, uint64_t scalar) {
    require_scalar(scalar);
    U128 num = static_cast<U128>(units) * Decimal::SCALE;
    return Decimal(static_cast<I128>(round_div(num, scalar)));
}

Decimal to_decimal(uint64_t units, const Coin& coin) {
    return to_decimal(units, coin.scalar);
}

uint64_t to_input_price(Decimal price, const Coin& base, const Coin& quote) {
    require_scalar(base.scalar);
    require_scalar(quote.scalar);

    U128 num = checked_mul(magnitude(price, "Price"), FLOAT_SCALAR, "Price");
    num = checked_mul(num, quote.scalar, "Price");
    U128 den = static_cast<U128>(Decimal::SCALE) * base.scalar;
    return narrow(round_div(num, den), "Price");
}

Decimal from_input_price(uint64_t price, const Coin& base, const Coin& quote) {
    require_scalar(base.scalar);
    require_scalar(quote.scalar);

    U128 num = checked_mul(static_cast<U128>(price), base.scalar, "Price");
    num = checked_mul(num, Decimal::SCALE, "Price");
    U128 den = static_cast<U128>(FLOAT_SCALAR) * quote.scalar;

    U128 scaled = round_div(num, den);
    if (scaled > I128_MAX) {
        throw AmountOverflowError("Price " + std::to_string(price) + " exceeds decimal range");
    }
    return Decimal(static_cast<I128>(scaled));
}

}  // namespace deepbook
