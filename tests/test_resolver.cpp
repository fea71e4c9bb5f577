// DeepBook SDK - Resolver and Proof Tests

#include <catch2/catch_test_macros.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/proof.hpp>
#include <deepbook/resolver.hpp>
#include "mock_ledger.hpp"

using namespace deepbook;
using deepbook::testing::MockLedger;

TEST_CASE("Resolving object references", "[resolver]") {
    auto ledger = std::make_shared<MockLedger>();
    ledger->add_shared("0x520c", 42);
    ledger->add_owned("0x7ca9", 11, 0x5A);
    ledger->add_immutable("0x1234", 1);
    ObjectResolver resolver(ledger);

    SECTION("Shared objects carry their initial version and mutability") {
        ObjectArg arg = resolver.resolve("0x520c", true).get();
        const auto& shared = std::get<SharedObject>(arg);
        REQUIRE(shared.object_id == ObjectId::from_hex("0x520c"));
        REQUIRE(shared.initial_shared_version == 42);
        REQUIRE(shared.is_mutable);

        REQUIRE_FALSE(std::get<SharedObject>(resolver.resolve_shared("0x520c", false).get()).is_mutable);
        REQUIRE(ledger->object_fetches() == 2);
    }

    SECTION("Owned objects are pinned to version and digest") {
        ObjectArg arg = resolver.resolve_owned("0x7ca9").get();
        const auto& ref = std::get<ImmOrOwnedObject>(arg).ref;
        REQUIRE(ref.object_id == ObjectId::from_hex("0x7ca9"));
        REQUIRE(ref.version == 11);
        REQUIRE(ref.digest[0] == 0x5A);
    }

    SECTION("Immutable objects resolve by reference when any ownership is allowed") {
        ObjectArg arg = resolver.resolve("0x1234", false).get();
        REQUIRE(std::get<ImmOrOwnedObject>(arg).ref.version == 1);
    }

    SECTION("Owned objects held by the expected address") {
        ObjectArg arg = resolver.resolve_owned("0x7ca9", SuiAddress::from_hex("0xa11ce")).get();
        REQUIRE(std::get<ImmOrOwnedObject>(arg).ref.version == 11);
    }

    SECTION("Nothing is cached") {
        resolver.resolve_owned("0x7ca9").get();
        ledger->add_owned("0x7ca9", 12, 0x5B);
        ObjectArg arg = resolver.resolve_owned("0x7ca9").get();
        REQUIRE(std::get<ImmOrOwnedObject>(arg).ref.version == 12);
        REQUIRE(ledger->object_fetches() == 2);
    }
}

TEST_CASE("Resolution failures", "[resolver]") {
    auto ledger = std::make_shared<MockLedger>();
    ledger->add_shared("0x520c", 42);
    ledger->add_owned("0x7ca9", 11, 0x5A);
    ObjectResolver resolver(ledger);

    SECTION("Owned object where a shared one is required") {
        auto pending = resolver.resolve_shared("0x7ca9", true);
        try {
            pending.get();
            FAIL("expected OwnershipMismatchError");
        } catch (const OwnershipMismatchError& e) {
            REQUIRE(e.expected() == "shared");
            REQUIRE(e.actual() == "address-owned");
            REQUIRE(e.object_id() == ObjectId::from_hex("0x7ca9").to_hex());
        }
    }

    SECTION("Shared object where an owned one is required") {
        REQUIRE_THROWS_AS(resolver.resolve_owned("0x520c").get(), OwnershipMismatchError);
    }

    SECTION("Immutable object where an owned one is required") {
        ledger->add_immutable("0x1234", 1);
        try {
            resolver.resolve_owned("0x1234").get();
            FAIL("expected OwnershipMismatchError");
        } catch (const OwnershipMismatchError& e) {
            REQUIRE(e.expected() == "owned");
            REQUIRE(e.actual() == "immutable");
        }
    }

    SECTION("Object-owned object where an owned one is required") {
        ledger->add_object_owned("0x555", 3, "0x7ca9");
        try {
            resolver.resolve_owned("0x555").get();
            FAIL("expected OwnershipMismatchError");
        } catch (const OwnershipMismatchError& e) {
            REQUIRE(e.actual() == "object-owned");
        }
    }

    SECTION("Owned object held by another address") {
        ledger->add_owned("0x666", 2, 0x01, "0xb0b");
        try {
            resolver.resolve_owned("0x666", SuiAddress::from_hex("0xa11ce")).get();
            FAIL("expected OwnershipMismatchError");
        } catch (const OwnershipMismatchError& e) {
            REQUIRE(e.expected() == "owned by " + SuiAddress::from_hex("0xa11ce").to_hex());
            REQUIRE(e.actual() == "owned by " + SuiAddress::from_hex("0xb0b").to_hex());
        }
    }

    SECTION("Malformed address fails before any remote read") {
        REQUIRE_THROWS_AS(resolver.resolve("not-an-address", true), ParseError);
        REQUIRE_THROWS_AS(resolver.resolve("0xnothex", true), ParseError);
        REQUIRE(ledger->object_fetches() == 0);
    }

    SECTION("Missing object") {
        auto pending = resolver.resolve("0xdead", true);
        try {
            pending.get();
            FAIL("expected FetchError");
        } catch (const FetchError& e) {
            REQUIRE(std::string(e.what()).find("Failed to fetch object") != std::string::npos);
            REQUIRE(error_chain(e).find("does not exist") != std::string::npos);
        }
    }

    SECTION("Shared object without an initial version") {
        ObjectInfo info;
        info.object_id = ObjectId::from_hex("0x99");
        info.ownership = OwnershipKind::Shared;
        REQUIRE_THROWS_AS(to_object_arg(info, true, RequiredOwnership::Any), FetchError);
    }
}

TEST_CASE("Trade proofs", "[proof]") {
    const ObjectId package = ObjectId::from_hex("0xdee9");
    TransactionBuilder tx;
    Argument manager = tx.object(SharedObject{ObjectId::from_hex("0x111"), 5, true});

    SECTION("Owner") {
        Argument proof = derive_proof(tx, package, manager, OwnerProof{});
        REQUIRE(proof == Argument::result(0));

        const auto& call = std::get<MoveCall>(tx.commands()[0]);
        REQUIRE(call.package == package);
        REQUIRE(call.module == "balance_manager");
        REQUIRE(call.function == "generate_proof_as_owner");
        REQUIRE(call.arguments == std::vector<Argument>{manager});
        REQUIRE(call.type_arguments.empty());
    }

    SECTION("Trader") {
        ObjectRef cap_ref{ObjectId::from_hex("0x444"), 3, {}};
        Argument cap = tx.object(ImmOrOwnedObject{cap_ref});
        derive_proof(tx, package, manager, TraderProof{cap});

        const auto& call = std::get<MoveCall>(tx.commands()[0]);
        REQUIRE(call.function == "generate_proof_as_trader");
        REQUIRE(call.arguments == std::vector<Argument>{manager, cap});
    }

    SECTION("Optional trade cap selects the path") {
        derive_proof(tx, package, manager, std::optional<Argument>{});
        REQUIRE(std::get<MoveCall>(tx.commands()[0]).function == "generate_proof_as_owner");
    }

    SECTION("Trade cap must be an object input") {
        Argument not_an_object = tx.pure(uint64_t{1});
        REQUIRE_THROWS_AS(derive_proof(tx, package, manager, TraderProof{not_an_object}),
                          SchemaError);
    }
}
