// DeepBook SDK - Client
// Configuration, ledger access, composers and dry-run queries in one place

#pragma once

#include <deepbook/balance_manager.hpp>
#include <deepbook/config.hpp>
#include <deepbook/deepbook.hpp>
#include <deepbook/ledger.hpp>
#include <deepbook/resolver.hpp>
#include <deepbook/simulation.hpp>
#include <deepbook/types.hpp>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace deepbook {

struct ManagerBalance {
    std::string coin_type;
    Decimal balance;
};

class DeepBookClient {
public:
    // Talks to config.rpc_url() over JSON-RPC
    explicit DeepBookClient(DeepBookConfig config);
    DeepBookClient(DeepBookConfig config, std::shared_ptr<LedgerClient> ledger);

    DeepBookClient(const DeepBookClient&) = delete;
    DeepBookClient& operator=(const DeepBookClient&) = delete;

    // Open order ids of a manager in a pool
    std::future<std::vector<U128>> account_open_orders(const std::string& pool_key,
                                                       const std::string& manager_key);

    std::future<ManagerBalance> check_manager_balance(const std::string& manager_key,
                                                      const std::string& coin_key);

    std::future<bool> whitelisted(const std::string& pool_key);

    // Mid price as quote per base
    std::future<Decimal> mid_price(const std::string& pool_key);

    [[nodiscard]] const DeepBookConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<LedgerClient>& ledger() const noexcept { return ledger_; }
    [[nodiscard]] ObjectResolver& resolver() noexcept { return *resolver_; }
    [[nodiscard]] BalanceManagerContract& balance_manager() noexcept { return balance_manager_; }
    [[nodiscard]] DeepBookContract& deep_book() noexcept { return deep_book_; }
    [[nodiscard]] SimulationExecutor& simulator() noexcept { return simulator_; }

private:
    DeepBookConfig config_;
    std::shared_ptr<LedgerClient> ledger_;
    std::shared_ptr<ObjectResolver> resolver_;
    BalanceManagerContract balance_manager_;
    DeepBookContract deep_book_;
    SimulationExecutor simulator_;
};

}  // namespace deepbook
