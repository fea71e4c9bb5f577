// DeepBook SDK - Basic Example
// Demonstrates configuration, pool queries and account reads over a fullnode

#include <deepbook/client.hpp>
#include <deepbook/config.hpp>
#include <deepbook/errors.hpp>
#include <iostream>

using namespace deepbook;

int main(int argc, char** argv) {
    try {
        // Build configuration from a TOML file, or fall back to testnet defaults
        DeepBookConfig config = argc > 1
            ? DeepBookConfig::from_file(argv[1])
            : DeepBookConfig("testnet", "0xa11ce");

        if (config.balance_managers().empty()) {
            config.with_balance_manager(
                "MANAGER_1",
                BalanceManager::owned("0x0c34e41694c5347c7a45978d161b5d6b543bec80702fee6e002118f333dbdfaf"));
        }

        std::cout << "Network: " << to_string(config.environment()) << "\n";
        std::cout << "Endpoint: " << config.rpc_url() << "\n";

        DeepBookClient client(config);

        std::cout << "\nFetching SUI_DBUSDC mid price...\n";
        std::cout << "Mid price: " << client.mid_price("SUI_DBUSDC").get().to_string() << "\n";

        std::cout << "Whitelisted: " << (client.whitelisted("SUI_DBUSDC").get() ? "yes" : "no") << "\n";

        std::cout << "\nFetching manager balances...\n";
        for (const char* coin : {"SUI", "DBUSDC", "DEEP"}) {
            auto balance = client.check_manager_balance("MANAGER_1", coin).get();
            std::cout << coin << ": " << balance.balance.to_string() << "\n";
        }

        std::cout << "\nFetching open orders...\n";
        auto orders = client.account_open_orders("SUI_DBUSDC", "MANAGER_1").get();
        for (U128 id : orders) {
            std::cout << "  " << u128_to_string(id) << "\n";
        }
        std::cout << orders.size() << " open orders\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << error_chain(e) << "\n";
        return 1;
    }

    return 0;
}
