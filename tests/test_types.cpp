// DeepBook SDK - Types Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/types.hpp>

using namespace deepbook;
using Catch::Approx;

TEST_CASE("Decimal parsing", "[types]") {
    SECTION("Whole and fractional parts") {
        REQUIRE(Decimal::from_string("0.1").scaled_value() == 100000000);
        REQUIRE(Decimal::from_string("12").scaled_value() == 12 * Decimal::SCALE);
        REQUIRE(Decimal::from_string(".5") == Decimal::from_string("0.5"));
        REQUIRE(Decimal::from_string("-1.25").is_negative());
    }

    SECTION("Digits beyond nine are rounded half away from zero") {
        REQUIRE(Decimal::from_string("0.0000000005").scaled_value() == 1);
        REQUIRE(Decimal::from_string("0.0000000004").scaled_value() == 0);
        REQUIRE(Decimal::from_string("0.0000000015").scaled_value() == 2);
    }

    SECTION("Malformed text") {
        REQUIRE_THROWS_AS(Decimal::from_string(""), ParseError);
        REQUIRE_THROWS_AS(Decimal::from_string("."), ParseError);
        REQUIRE_THROWS_AS(Decimal::from_string("1.2.3"), ParseError);
        REQUIRE_THROWS_AS(Decimal::from_string("abc"), ParseError);
    }
}

TEST_CASE("Decimal formatting", "[types]") {
    REQUIRE(Decimal::from_string("0.1").to_string() == "0.1");
    REQUIRE(Decimal::from_string("12").to_string() == "12");
    REQUIRE(Decimal::from_string("0.1").to_fixed() == "0.100000000");
    REQUIRE(Decimal::from_string("-2.5").to_string() == "-2.5");
    REQUIRE(Decimal::from_double(1.5).to_double() == Approx(1.5));
}

TEST_CASE("Rounded division", "[types]") {
    SECTION("Ties go away from zero by default") {
        REQUIRE(round_div(5, 10) == 1);
        REQUIRE(round_div(25, 10) == 3);
        REQUIRE(round_div(24, 10) == 2);
    }

    SECTION("Half to even keeps even quotients") {
        REQUIRE(round_div(25, 10, RoundingMode::HalfToEven) == 2);
        REQUIRE(round_div(35, 10, RoundingMode::HalfToEven) == 4);
    }

    SECTION("Conversions round half away from zero") {
        REQUIRE(AMOUNT_ROUNDING == RoundingMode::HalfAwayFromZero);
    }
}

TEST_CASE("Numeric identifiers", "[types]") {
    SECTION("u64") {
        REQUIRE(parse_u64("42", "client order id") == 42);
        REQUIRE(parse_u64("18446744073709551615", "id") == UINT64_MAX);
        REQUIRE_THROWS_AS(parse_u64("18446744073709551616", "id"), ParseError);
        REQUIRE_THROWS_AS(parse_u64("12a", "id"), ParseError);
        REQUIRE_THROWS_AS(parse_u64("", "id"), ParseError);
        REQUIRE_THROWS_AS(parse_u64("-1", "id"), ParseError);
    }

    SECTION("u128") {
        U128 max = parse_u128("340282366920938463463374607431768211455", "order id");
        REQUIRE(max == ~static_cast<U128>(0));
        REQUIRE(u128_to_string(max) == "340282366920938463463374607431768211455");
        REQUIRE_THROWS_AS(parse_u128("340282366920938463463374607431768211456", "order id"),
                          ParseError);
        REQUIRE(u128_to_string(0) == "0");
    }

    SECTION("Error message names the field") {
        try {
            parse_u64("x1", "client order id");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(std::string(e.what()).find("client order id") != std::string::npos);
        }
    }
}

TEST_CASE("Error chains", "[types]") {
    try {
        try {
            throw ParseError("bad digit");
        } catch (const std::exception&) {
            std::throw_with_nested(CompositionError("place_limit_order(pool=P)"));
        }
    } catch (const CompositionError& e) {
        REQUIRE(has_cause<ParseError>(e));
        REQUIRE_FALSE(has_cause<FetchError>(e));
        REQUIRE(error_chain(e) == "place_limit_order(pool=P): caused by: bad digit");
    }

    LookupError lookup("Pool", "NOPE");
    REQUIRE(std::string(lookup.what()) == "Pool not found for key: NOPE");
    REQUIRE(lookup.kind() == "Pool");
    REQUIRE(lookup.key() == "NOPE");
}
