// DeepBook SDK - Client Implementation

#include <deepbook/client.hpp>
#include <deepbook/amount.hpp>
#include <deepbook/json_rpc.hpp>
#include <deepbook/log.hpp>

namespace deepbook {

DeepBookClient::DeepBookClient(DeepBookConfig config)
    : DeepBookClient(config, std::make_shared<JsonRpcClient>(config.rpc_url())) {}

DeepBookClient::DeepBookClient(DeepBookConfig config, std::shared_ptr<LedgerClient> ledger)
    : config_(std::move(config)),
      ledger_(std::move(ledger)),
      resolver_(std::make_shared<ObjectResolver>(ledger_)),
      balance_manager_(config_, resolver_),
      deep_book_(config_, resolver_),
      simulator_(ledger_, SuiAddress::from_hex(config_.address())) {
    log::set_level(config_.log_level());
    log::logger()->debug("client ready on {} ({} coins, {} pools)", to_string(config_.environment()),
                         config_.coins().size(), config_.pools().size());
}

std::future<std::vector<U128>> DeepBookClient::account_open_orders(const std::string& pool_key,
                                                                   const std::string& manager_key) {
    return std::async(std::launch::async, [this, pool_key, manager_key]() {
        TransactionBuilder tx;
        deep_book_.account_open_orders(tx, pool_key, manager_key).get();
        return simulator_.simulate<bcs::VecSet<U128>>(tx).get().contents;
    });
}

std::future<ManagerBalance> DeepBookClient::check_manager_balance(const std::string& manager_key,
                                                                  const std::string& coin_key) {
    return std::async(std::launch::async, [this, manager_key, coin_key]() {
        TransactionBuilder tx;
        balance_manager_.check_manager_balance(tx, manager_key, coin_key).get();
        uint64_t units = simulator_.simulate<uint64_t>(tx).get();

        Coin coin = *config_.get_coin(coin_key);
        return ManagerBalance{coin.type, to_decimal(units, coin)};
    });
}

std::future<bool> DeepBookClient::whitelisted(const std::string& pool_key) {
    return std::async(std::launch::async, [this, pool_key]() {
        TransactionBuilder tx;
        deep_book_.whitelisted(tx, pool_key).get();
        return simulator_.simulate<bool>(tx).get();
    });
}

std::future<Decimal> DeepBookClient::mid_price(const std::string& pool_key) {
    return std::async(std::launch::async, [this, pool_key]() {
        TransactionBuilder tx;
        deep_book_.mid_price(tx, pool_key).get();
        uint64_t price = simulator_.simulate<uint64_t>(tx).get();

        auto [base, quote] = deep_book_.pool_coins(pool_key);
        return from_input_price(price, base, quote);
    });
}

}  // namespace deepbook
