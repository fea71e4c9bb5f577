// DeepBook SDK - Pool Composer
// Order placement, cancellation and pool queries
//
// Every operation looks up its keys and parses its numeric inputs before any remote
// read, resolves the referenced objects concurrently, then appends inputs and calls in
// the order the pool module declares them. The builder must outlive the returned future
// and must not be used by anything else until it resolves.

#pragma once

#include <deepbook/constants.hpp>
#include <deepbook/contract.hpp>
#include <deepbook/types.hpp>
#include <future>
#include <string>

namespace deepbook {

struct PlaceLimitOrderParams {
    std::string pool_key;
    std::string balance_manager_key;
    std::string client_order_id;
    Decimal price;
    Decimal quantity;
    bool is_bid = true;
    uint64_t expiration = MAX_TIMESTAMP;
    OrderType order_type = OrderType::NoRestriction;
    SelfMatchingOption self_matching_option = SelfMatchingOption::SelfMatchingAllowed;
    bool pay_with_deep = true;
};

struct PlaceMarketOrderParams {
    std::string pool_key;
    std::string balance_manager_key;
    std::string client_order_id;
    Decimal quantity;
    bool is_bid = true;
    SelfMatchingOption self_matching_option = SelfMatchingOption::SelfMatchingAllowed;
    bool pay_with_deep = true;
};

class DeepBookContract : public ContractBase {
public:
    DeepBookContract(const DeepBookConfig& config, std::shared_ptr<ObjectResolver> resolver);

    std::future<Argument> place_limit_order(TransactionBuilder& tx,
                                            const PlaceLimitOrderParams& params);

    std::future<Argument> place_market_order(TransactionBuilder& tx,
                                             const PlaceMarketOrderParams& params);

    // order_id is the u128 on-chain order id, in decimal
    std::future<Argument> modify_order(TransactionBuilder& tx, const std::string& pool_key,
                                       const std::string& balance_manager_key,
                                       const std::string& order_id, Decimal new_quantity);

    std::future<Argument> cancel_order(TransactionBuilder& tx, const std::string& pool_key,
                                       const std::string& balance_manager_key,
                                       const std::string& order_id);

    std::future<Argument> cancel_all_orders(TransactionBuilder& tx, const std::string& pool_key,
                                            const std::string& balance_manager_key);

    std::future<Argument> withdraw_settled_amounts(TransactionBuilder& tx,
                                                   const std::string& pool_key,
                                                   const std::string& balance_manager_key);

    // Returns VecSet<u128> of open order ids
    std::future<Argument> account_open_orders(TransactionBuilder& tx, const std::string& pool_key,
                                              const std::string& balance_manager_key);

    // Returns bool
    std::future<Argument> whitelisted(TransactionBuilder& tx, const std::string& pool_key);

    // Returns u64 in on-chain price units
    std::future<Argument> mid_price(TransactionBuilder& tx, const std::string& pool_key);

    // Base and quote coins of a pool; throws LookupError
    [[nodiscard]] std::pair<Coin, Coin> pool_coins(const std::string& pool_key) const;
};

}  // namespace deepbook
