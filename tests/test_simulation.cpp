// DeepBook SDK - Simulation and Client Tests

#include <catch2/catch_test_macros.hpp>
#include <deepbook/client.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/simulation.hpp>
#include "mock_ledger.hpp"

using namespace deepbook;
using deepbook::testing::MockLedger;
using deepbook::testing::returning;

using Bytes = std::vector<uint8_t>;

namespace {

const MoveFunction QUERY{"m", "q", {}, 0};

void add_query(TransactionBuilder& tx) {
    tx.move_call(ObjectId::from_hex("0x2"), QUERY, {}, {});
}

Bytes order_id_set() {
    Bytes bytes{2};
    Bytes first(16, 0);
    first[0] = 5;
    Bytes second(16, 0);
    second[0] = 9;
    bytes.insert(bytes.end(), first.begin(), first.end());
    bytes.insert(bytes.end(), second.begin(), second.end());
    return bytes;
}

}  // namespace

TEST_CASE("Simulated reads", "[simulation]") {
    auto ledger = std::make_shared<MockLedger>();
    SimulationExecutor executor(ledger, SuiAddress::from_hex("0xa11ce"));
    TransactionBuilder tx;
    add_query(tx);

    SECTION("Decodes the first return value") {
        ledger->set_dev_inspect_result(returning(order_id_set(), "vector<u128>"));
        auto ids = executor.simulate<bcs::VecSet<U128>>(tx).get().contents;
        REQUIRE(ids.size() == 2);
        REQUIRE(ids[0] == 5);
        REQUIRE(ids[1] == 9);

        REQUIRE(ledger->dev_inspects() == 1);
        REQUIRE(ledger->last_sender() == SuiAddress::from_hex("0xa11ce"));
        REQUIRE(ledger->last_transaction().commands.size() == 1);
    }

    SECTION("Finishes the builder") {
        ledger->set_dev_inspect_result(returning({1}, "bool"));
        REQUIRE(executor.simulate<bool>(tx).get());
        REQUIRE(tx.finished());
        REQUIRE_THROWS_AS(executor.simulate<bool>(tx), BuilderError);
        REQUIRE(ledger->dev_inspects() == 1);
    }

    SECTION("Only the first value of the first call is read") {
        DevInspectResult result = returning(bcs::to_bytes(uint64_t{77}));
        result.results->front().return_values.push_back(ReturnValue{{1}, "bool"});
        result.results->push_back(CommandResult{{ReturnValue{{0}, "bool"}}});
        ledger->set_dev_inspect_result(result);
        REQUIRE(executor.simulate<uint64_t>(tx).get() == 77);
    }

    SECTION("Execution failure") {
        DevInspectResult result;
        result.error = "MoveAbort(pool, 3)";
        ledger->set_dev_inspect_result(result);
        try {
            executor.simulate<uint64_t>(tx).get();
            FAIL("expected ExecutionFailedError");
        } catch (const ExecutionFailedError& e) {
            REQUIRE(std::string(e.what()).find("MoveAbort(pool, 3)") != std::string::npos);
        }
    }

    SECTION("No results") {
        ledger->set_dev_inspect_result(DevInspectResult{});
        REQUIRE_THROWS_AS(executor.simulate<uint64_t>(tx).get(), MissingResultsError);
    }

    SECTION("Empty results") {
        DevInspectResult result;
        result.results.emplace();
        ledger->set_dev_inspect_result(result);
        REQUIRE_THROWS_AS(executor.simulate<uint64_t>(tx).get(), MissingCommandResultError);
    }

    SECTION("No return values") {
        DevInspectResult result;
        result.results = std::vector<CommandResult>{CommandResult{}};
        ledger->set_dev_inspect_result(result);
        REQUIRE_THROWS_AS(executor.simulate<uint64_t>(tx).get(), MissingReturnValueError);
    }

    SECTION("Undecodable value") {
        ledger->set_dev_inspect_result(returning({1, 2, 3}));
        try {
            executor.simulate<uint64_t>(tx).get();
            FAIL("expected SimulationError");
        } catch (const SimulationError& e) {
            REQUIRE(has_cause<DecodeError>(e));
        }
    }

    SECTION("Transport failure") {
        ledger->fail_dev_inspect(true);
        try {
            executor.simulate_raw(tx).get();
            FAIL("expected FetchError");
        } catch (const FetchError& e) {
            REQUIRE(error_chain(e).find("connection refused") != std::string::npos);
        }
    }
}

TEST_CASE("Result checks", "[simulation]") {
    SECTION("Execution error wins over missing results") {
        DevInspectResult result;
        result.error = "out of gas";
        REQUIRE_THROWS_AS(first_return_value(result), ExecutionFailedError);
    }

    SECTION("Raw bytes") {
        REQUIRE(first_return_value(returning({4, 2})) == Bytes{4, 2});
    }
}

TEST_CASE("Client queries", "[client]") {
    auto ledger = std::make_shared<MockLedger>();
    ledger->add_shared("0x520c89c6c78c566eed0ebf24f854a8c22d8fdd06a6f16ad01f108dad7f1baaea", 10);
    ledger->add_shared("0x111", 20);
    ledger->add_shared(CLOCK_OBJECT_ID, 1);

    DeepBookConfig config("testnet", "0xa11ce");
    config.with_balance_manager("MANAGER_1", BalanceManager::owned("0x111"));
    DeepBookClient client(config, ledger);

    SECTION("Open orders") {
        ledger->set_dev_inspect_result(returning(order_id_set(), "vector<u128>"));
        auto ids = client.account_open_orders("SUI_DBUSDC", "MANAGER_1").get();
        REQUIRE(ids.size() == 2);
        REQUIRE(ids[1] == 9);
        REQUIRE(ledger->last_sender() == SuiAddress::from_hex("0xa11ce"));

        ProgrammableTransaction sent = ledger->last_transaction();
        REQUIRE(std::get<MoveCall>(sent.commands.at(0)).function == "account_open_orders");
    }

    SECTION("Manager balance in coin units") {
        ledger->set_dev_inspect_result(returning(bcs::to_bytes(uint64_t{1'500'000'000})));
        ManagerBalance balance = client.check_manager_balance("MANAGER_1", "SUI").get();
        REQUIRE(balance.balance == Decimal::from_string("1.5"));
        REQUIRE(TypeTag::parse(balance.coin_type) == TypeTag::parse("0x2::sui::SUI"));
    }

    SECTION("Whitelist flag") {
        ledger->set_dev_inspect_result(returning({1}, "bool"));
        REQUIRE(client.whitelisted("SUI_DBUSDC").get());
    }

    SECTION("Mid price as a decimal") {
        ledger->set_dev_inspect_result(returning(bcs::to_bytes(uint64_t{2'500'000})));
        REQUIRE(client.mid_price("SUI_DBUSDC").get() == Decimal::from_string("2.5"));
    }

    SECTION("Composition failures surface through the query") {
        try {
            client.account_open_orders("NOPE", "MANAGER_1").get();
            FAIL("expected CompositionError");
        } catch (const CompositionError& e) {
            REQUIRE(has_cause<LookupError>(e));
        }
        REQUIRE(ledger->dev_inspects() == 0);
    }

    SECTION("Accessors") {
        REQUIRE(client.config().get_balance_manager("MANAGER_1").has_value());
        REQUIRE(client.simulator().sender() == SuiAddress::from_hex("0xa11ce"));
        REQUIRE(client.ledger() == ledger);
    }
}
