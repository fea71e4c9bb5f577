// DeepBook SDK - Order Bundle Example
// Composes a limit order and a settled-amount withdrawal into one bundle and prints its payload

#include <deepbook/client.hpp>
#include <deepbook/encoding.hpp>
#include <deepbook/errors.hpp>
#include <iostream>

using namespace deepbook;

int main() {
    DeepBookConfig config("testnet", "0xa11ce");
    config.with_balance_manager(
        "MANAGER_1",
        BalanceManager::owned("0x0c34e41694c5347c7a45978d161b5d6b543bec80702fee6e002118f333dbdfaf"));

    DeepBookClient client(config);
    TransactionBuilder tx;

    try {
        // Resting bid for 10 SUI at 2.5 DBUSDC
        PlaceLimitOrderParams order;
        order.pool_key = "SUI_DBUSDC";
        order.balance_manager_key = "MANAGER_1";
        order.client_order_id = "1001";
        order.price = Decimal::from_string("2.5");
        order.quantity = Decimal::from_string("10");
        order.order_type = OrderType::PostOnly;

        client.deep_book().place_limit_order(tx, order).get();
        std::cout << "Composed limit order (" << to_string(order.order_type) << ")\n";

        client.deep_book().withdraw_settled_amounts(tx, "SUI_DBUSDC", "MANAGER_1").get();
        std::cout << "Composed settlement withdrawal\n";

    } catch (const CompositionError& e) {
        // The bundle still holds everything composed before the failure
        std::cerr << "Composition failed: " << error_chain(e) << "\n";
        if (tx.commands().empty()) return 1;
    }

    ProgrammableTransaction ptx = tx.finish();
    std::cout << ptx.inputs.size() << " inputs, " << ptx.commands.size() << " commands\n";
    std::cout << "Kind bytes (base64): "
              << encoding::encode_base64(ptx.transaction_kind_bytes()) << "\n";
    return 0;
}
