// DeepBook SDK - Amount Conversion
// Decimal quantities and prices to on-chain integer units, and back
//
// All conversions use exact 128-bit integer arithmetic and round once,
// at the end, with AMOUNT_ROUNDING (half away from zero).

#pragma once

#include <deepbook/constants.hpp>
#include <deepbook/types.hpp>
#include <cstdint>

namespace deepbook {

// round(amount * scalar). Throws AmountOverflowError if amount is negative
// or the result does not fit in 64 bits.
uint64_t to_units(Decimal amount, uint64_t scalar);
uint64_t to_units(Decimal amount, const Coin& coin);

// units / scalar at nine fractional digits
Decimal to_decimal(uint64_t units, uint64_t scalar);
Decimal to_decimal(uint64_t units, const Coin& coin);

// round(price * FLOAT_SCALAR * quote.scalar / base.scalar), evaluated as a single quotient
uint64_t to_input_price(Decimal price, const Coin& base, const Coin& quote);

// Inverse of to_input_price, for prices read back from a pool
Decimal from_input_price(uint64_t price, const Coin& base, const Coin& quote);

}  // namespace deepbook
