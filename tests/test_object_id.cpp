// DeepBook SDK - Object Id and Type Tag Tests

#include <catch2/catch_test_macros.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/object_id.hpp>
#include <deepbook/type_tag.hpp>

using namespace deepbook;

namespace {

const std::string SUI_FULL =
    "0x0000000000000000000000000000000000000000000000000000000000000002::sui::SUI";

}  // namespace

TEST_CASE("Object ids", "[object_id]") {
    SECTION("Short form is left-padded") {
        ObjectId clock = ObjectId::from_hex("0x6");
        REQUIRE(clock.to_hex() == "0x" + std::string(63, '0') + "6");
        REQUIRE(short_hex(clock) == "0x6");
        REQUIRE(clock.bytes()[31] == 6);
    }

    SECTION("Case-insensitive digits") {
        REQUIRE(ObjectId::from_hex("0xABCD") == ObjectId::from_hex("0xabcd"));
    }

    SECTION("Full length") {
        std::string full = "0x" + std::string(64, 'f');
        REQUIRE(ObjectId::from_hex(full).to_hex() == full);
    }

    SECTION("Malformed addresses") {
        REQUIRE_THROWS_AS(ObjectId::from_hex("6"), ParseError);
        REQUIRE_THROWS_AS(ObjectId::from_hex("0x"), ParseError);
        REQUIRE_THROWS_AS(ObjectId::from_hex("0xzz"), ParseError);
        REQUIRE_THROWS_AS(ObjectId::from_hex("0x" + std::string(65, '1')), ParseError);
    }

    SECTION("Zero address") {
        REQUIRE(short_hex(ObjectId{}) == "0x0");
    }
}

TEST_CASE("Object digests", "[object_id]") {
    ObjectDigest digest{};
    for (size_t i = 0; i < digest.size(); ++i) digest[i] = static_cast<uint8_t>(i + 1);

    std::string text = digest_to_base58(digest);
    REQUIRE(digest_from_base58(text) == digest);

    REQUIRE_THROWS_AS(digest_from_base58("0OIl"), ParseError);
    REQUIRE_THROWS_AS(digest_from_base58("StV1DL6CwTryKyV"), ParseError);  // 11 bytes
}

TEST_CASE("Type tag parsing", "[type_tag]") {
    SECTION("Struct") {
        TypeTag sui = TypeTag::parse("0x2::sui::SUI");
        REQUIRE(sui.kind() == TypeTag::Kind::Struct);
        REQUIRE(sui.struct_tag().address == ObjectId::from_hex("0x2"));
        REQUIRE(sui.struct_tag().module == "sui");
        REQUIRE(sui.struct_tag().name == "SUI");
        REQUIRE(sui.struct_tag().type_params.empty());
        REQUIRE(sui.to_string() == SUI_FULL);
        REQUIRE(TypeTag::parse(SUI_FULL) == sui);
    }

    SECTION("Primitives and vectors") {
        REQUIRE(TypeTag::parse("u64").kind() == TypeTag::Kind::U64);
        REQUIRE(TypeTag::parse("address").kind() == TypeTag::Kind::Address);

        TypeTag bytes = TypeTag::parse("vector<u8>");
        REQUIRE(bytes.kind() == TypeTag::Kind::Vector);
        REQUIRE(bytes.element().kind() == TypeTag::Kind::U8);
        REQUIRE(bytes.to_string() == "vector<u8>");
    }

    SECTION("Generic structs") {
        TypeTag coin = TypeTag::parse("0x2::coin::Coin<0x2::sui::SUI>");
        REQUIRE(coin.struct_tag().type_params.size() == 1);
        REQUIRE(coin.struct_tag().type_params[0] == TypeTag::parse("0x2::sui::SUI"));

        TypeTag pool = TypeTag::parse("0xdee::pool::Pool<0x2::sui::SUI, vector<u64>>");
        REQUIRE(pool.struct_tag().type_params.size() == 2);
        REQUIRE(pool.struct_tag().type_params[1].kind() == TypeTag::Kind::Vector);
    }

    SECTION("Malformed tags") {
        REQUIRE_THROWS_AS(TypeTag::parse("0x2::sui"), ParseError);
        REQUIRE_THROWS_AS(TypeTag::parse("0x2::sui::SUI<"), ParseError);
        REQUIRE_THROWS_AS(TypeTag::parse("u8 extra"), ParseError);
        REQUIRE_THROWS_AS(TypeTag::parse(""), ParseError);
        REQUIRE_THROWS_AS(TypeTag::parse("sui::SUI"), ParseError);
    }

    SECTION("Wrong-kind access") {
        REQUIRE_THROWS_AS(TypeTag::parse("u8").struct_tag(), std::logic_error);
        REQUIRE_THROWS_AS(TypeTag::parse("0x2::sui::SUI").element(), std::logic_error);
    }
}

TEST_CASE("Type tag encoding", "[type_tag]") {
    SECTION("Primitive") {
        REQUIRE(bcs::to_bytes(TypeTag::parse("u64")) == std::vector<uint8_t>{2});
        REQUIRE(bcs::to_bytes(TypeTag::parse("vector<u8>")) == std::vector<uint8_t>{6, 1});
    }

    SECTION("Struct") {
        std::vector<uint8_t> expected{7};
        std::vector<uint8_t> address(32, 0);
        address[31] = 2;
        expected.insert(expected.end(), address.begin(), address.end());
        std::vector<uint8_t> names{3, 's', 'u', 'i', 3, 'S', 'U', 'I', 0};
        expected.insert(expected.end(), names.begin(), names.end());

        REQUIRE(bcs::to_bytes(TypeTag::parse("0x2::sui::SUI")) == expected);
    }
}
