// DeepBook SDK - Transaction Builder Tests

#include <catch2/catch_test_macros.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/transaction.hpp>

using namespace deepbook;

using Bytes = std::vector<uint8_t>;

namespace {

const ObjectId PACKAGE = ObjectId::from_hex("0x2");

const MoveFunction TAKES_PURE{"m", "f", {ParamKind::Pure}, 0};
const MoveFunction TAKES_OBJECT_AND_RESULT{"m", "g", {ParamKind::Object, ParamKind::Result}, 1};

SharedObject shared(const char* address, uint64_t version, bool is_mutable) {
    return SharedObject{ObjectId::from_hex(address), version, is_mutable};
}

ImmOrOwnedObject owned(const char* address, uint64_t version) {
    ObjectRef ref{ObjectId::from_hex(address), version, {}};
    ref.digest.fill(0xAB);
    return ImmOrOwnedObject{ref};
}

void append(Bytes& out, const Bytes& more) {
    out.insert(out.end(), more.begin(), more.end());
}

}  // namespace

TEST_CASE("Builder inputs", "[builder]") {
    TransactionBuilder tx;

    SECTION("Inputs are indexed in append order") {
        REQUIRE(tx.pure(uint64_t{1}) == Argument::input(0));
        REQUIRE(tx.pure(true) == Argument::input(1));
        REQUIRE(tx.object(shared("0x6", 1, false)) == Argument::input(2));
        REQUIRE(tx.inputs().size() == 3);
        REQUIRE(std::get<PureArg>(tx.inputs()[0]).bytes == Bytes{1, 0, 0, 0, 0, 0, 0, 0});
    }

    SECTION("The same object twice is one input") {
        Argument first = tx.object(shared("0x6", 1, false));
        Argument second = tx.object(shared("0x6", 1, false));
        REQUIRE(first == second);
        REQUIRE(tx.inputs().size() == 1);
    }

    SECTION("Mutable use anywhere makes a shared input mutable") {
        tx.object(shared("0xabc", 7, false));
        tx.object(shared("0xabc", 7, true));
        tx.object(shared("0xabc", 7, false));

        const auto& arg = std::get<SharedObject>(std::get<ObjectArg>(tx.inputs()[0]));
        REQUIRE(arg.is_mutable);
        REQUIRE(tx.inputs().size() == 1);
    }

    SECTION("Conflicting ownership kinds") {
        tx.object(shared("0xabc", 7, false));
        REQUIRE_THROWS_AS(tx.object(owned("0xabc", 3)), BuilderError);
    }

    SECTION("Pure values are never merged") {
        tx.pure(uint64_t{1});
        tx.pure(uint64_t{1});
        REQUIRE(tx.inputs().size() == 2);
    }
}

TEST_CASE("Builder move calls", "[builder]") {
    TransactionBuilder tx;

    SECTION("Result of a call") {
        Argument p = tx.pure(uint8_t{5});
        REQUIRE(tx.move_call(PACKAGE, TAKES_PURE, {}, {p}) == Argument::result(0));
        REQUIRE(tx.move_call(PACKAGE, TAKES_PURE, {}, {p}) == Argument::result(1));

        const auto& call = std::get<MoveCall>(tx.commands()[0]);
        REQUIRE(call.package == PACKAGE);
        REQUIRE(call.module == "m");
        REQUIRE(call.function == "f");
        REQUIRE(call.arguments == std::vector<Argument>{p});
    }

    SECTION("Argument count") {
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_PURE, {}, {}), SchemaError);
    }

    SECTION("Type argument count") {
        Argument obj = tx.object(shared("0x6", 1, false));
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_OBJECT_AND_RESULT, {},
                                       {obj, Argument::gas_coin()}),
                          SchemaError);
    }

    SECTION("Parameter kinds") {
        Argument p = tx.pure(uint8_t{5});
        Argument obj = tx.object(shared("0x6", 1, false));
        std::vector<TypeTag> sui{TypeTag::parse("0x2::sui::SUI")};

        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_PURE, {}, {obj}), SchemaError);
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_OBJECT_AND_RESULT, sui, {p, Argument::gas_coin()}),
                          SchemaError);
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_OBJECT_AND_RESULT, sui, {obj, p}), SchemaError);
        REQUIRE(tx.move_call(PACKAGE, TAKES_OBJECT_AND_RESULT, sui, {obj, Argument::gas_coin()}) ==
                Argument::result(0));
        REQUIRE(tx.commands().size() == 1);
    }

    SECTION("Dangling references") {
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_PURE, {}, {Argument::input(3)}), SchemaError);

        Argument obj = tx.object(shared("0x6", 1, false));
        std::vector<TypeTag> sui{TypeTag::parse("0x2::sui::SUI")};
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_OBJECT_AND_RESULT, sui,
                                       {obj, Argument::result(0)}),
                          SchemaError);
    }
}

TEST_CASE("Builder coin commands", "[builder]") {
    TransactionBuilder tx;

    SECTION("Split yields one nested result per amount") {
        auto coins = tx.split_coins(Argument::gas_coin(), {tx.pure(uint64_t{10}), tx.pure(uint64_t{20})});
        REQUIRE(coins.size() == 2);
        REQUIRE(coins[0] == Argument::nested_result(0, 0));
        REQUIRE(coins[1] == Argument::nested_result(0, 1));
    }

    SECTION("Merge and transfer") {
        auto coins = tx.split_coins(Argument::gas_coin(), {tx.pure(uint64_t{10})});
        tx.merge_coins(Argument::gas_coin(), coins);
        Argument recipient = tx.pure(ObjectId::from_hex("0xa11ce"));
        REQUIRE(tx.transfer_objects({Argument::gas_coin()}, recipient) == Argument::result(2));
        REQUIRE(std::holds_alternative<MergeCoins>(tx.commands()[1]));
        REQUIRE(std::holds_alternative<TransferObjects>(tx.commands()[2]));
    }
}

TEST_CASE("Builder finish", "[builder]") {
    TransactionBuilder tx;
    Argument p = tx.pure(uint8_t{5});
    tx.move_call(PACKAGE, TAKES_PURE, {}, {p});

    ProgrammableTransaction ptx = tx.finish();
    REQUIRE(tx.finished());
    REQUIRE(ptx.inputs.size() == 1);
    REQUIRE(ptx.commands.size() == 1);

    SECTION("Finished builders reject appends") {
        REQUIRE_THROWS_AS(tx.pure(uint8_t{1}), BuilderError);
        REQUIRE_THROWS_AS(tx.object(shared("0x6", 1, false)), BuilderError);
        REQUIRE_THROWS_AS(tx.move_call(PACKAGE, TAKES_PURE, {}, {p}), BuilderError);
        REQUIRE(tx.inputs().size() == 1);
    }

    SECTION("Finish works once") {
        REQUIRE_THROWS_AS(tx.finish(), BuilderError);
    }

    SECTION("Checkpoints cannot open on a finished builder") {
        REQUIRE_THROWS_AS(BuilderCheckpoint(tx), BuilderError);
    }
}

TEST_CASE("Builder checkpoints", "[builder]") {
    TransactionBuilder tx;
    tx.object(shared("0xabc", 7, false));
    tx.pure(uint64_t{1});
    tx.move_call(PACKAGE, TAKES_PURE, {}, {Argument::input(1)});

    SECTION("Rollback restores inputs, mutability and commands") {
        {
            BuilderCheckpoint checkpoint(tx);
            tx.object(shared("0xabc", 7, true));
            tx.object(shared("0xdef", 9, true));
            Argument p = tx.pure(uint64_t{2});
            tx.move_call(PACKAGE, TAKES_PURE, {}, {p});
        }

        REQUIRE(tx.inputs().size() == 2);
        REQUIRE(tx.commands().size() == 1);
        const auto& arg = std::get<SharedObject>(std::get<ObjectArg>(tx.inputs()[0]));
        REQUIRE_FALSE(arg.is_mutable);

        // Index of a rolled-back object is free again
        REQUIRE(tx.object(owned("0xdef", 3)) == Argument::input(2));
    }

    SECTION("Commit keeps everything") {
        {
            BuilderCheckpoint checkpoint(tx);
            tx.object(shared("0xdef", 9, true));
            tx.move_call(PACKAGE, TAKES_PURE, {}, {Argument::input(1)});
            checkpoint.commit();
        }
        REQUIRE(tx.inputs().size() == 3);
        REQUIRE(tx.commands().size() == 2);
    }
}

TEST_CASE("Transaction kind encoding", "[builder]") {
    SECTION("Pure input and one call") {
        TransactionBuilder tx;
        Argument p = tx.pure(uint8_t{5});
        tx.move_call(PACKAGE, TAKES_PURE, {}, {p});

        Bytes expected{0, 1, 0, 1, 5, 1, 0};
        append(expected, bcs::to_bytes(PACKAGE));
        append(expected, {1, 'm', 1, 'f', 0, 1, 1, 0, 0});

        REQUIRE(tx.finish().transaction_kind_bytes() == expected);
    }

    SECTION("Object inputs") {
        ProgrammableTransaction ptx;
        ptx.inputs.emplace_back(ObjectArg{shared("0x6", 1, false)});
        ptx.inputs.emplace_back(ObjectArg{owned("0x7", 3)});

        Bytes expected{0, 2};
        append(expected, {1, 1});
        append(expected, bcs::to_bytes(ObjectId::from_hex("0x6")));
        append(expected, {1, 0, 0, 0, 0, 0, 0, 0, 0});
        append(expected, {1, 0});
        append(expected, bcs::to_bytes(ObjectId::from_hex("0x7")));
        append(expected, {3, 0, 0, 0, 0, 0, 0, 0, 32});
        append(expected, Bytes(32, 0xAB));
        append(expected, {0});

        REQUIRE(ptx.transaction_kind_bytes() == expected);
    }

    SECTION("Nested results and the gas coin") {
        ProgrammableTransaction ptx;
        ptx.commands.emplace_back(
            TransferObjects{{Argument::nested_result(1, 2)}, Argument::gas_coin()});

        Bytes expected{0, 0, 1, 1, 1, 3, 1, 0, 2, 0, 0};
        REQUIRE(ptx.transaction_kind_bytes() == expected);
    }
}
