// DeepBook SDK - Pool Composer Implementation

#include <deepbook/deepbook.hpp>
#include <deepbook/amount.hpp>
#include <deepbook/functions.hpp>

namespace deepbook {

DeepBookContract::DeepBookContract(const DeepBookConfig& config,
                                   std::shared_ptr<ObjectResolver> resolver)
    : ContractBase(config, std::move(resolver)) {}

std::pair<Coin, Coin> DeepBookContract::pool_coins(const std::string& pool_key) const {
    Pool pool = require_pool(pool_key);
    return {require_coin(pool.base_coin), require_coin(pool.quote_coin)};
}

std::future<Argument> DeepBookContract::place_limit_order(TransactionBuilder& tx,
                                                          const PlaceLimitOrderParams& params) {
    return std::async(std::launch::async, [this, &tx, params]() {
        std::string op = describe_op("place_limit_order", {{"pool", params.pool_key},
                                                           {"manager", params.balance_manager_key}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(params.pool_key);
            BalanceManager manager = require_balance_manager(params.balance_manager_key);
            auto [base, quote] = pool_coins(params.pool_key);

            uint64_t client_order_id = parse_u64(params.client_order_id, "client order id");
            uint64_t input_price = to_input_price(params.price, base, quote);
            uint64_t input_quantity = to_units(params.quantity, base);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, true);
            auto manager_obj = resolve_manager(params.balance_manager_key, manager, true);
            auto clock_obj = resolve_clock();

            Argument pool_arg = add_input(tx, pool_obj, "pool", params.pool_key);
            auto [manager_arg, proof] = add_manager_with_proof(tx, manager_obj);

            std::vector<Argument> args{
                pool_arg,
                manager_arg,
                proof,
                tx.pure(client_order_id),
                tx.pure(static_cast<uint8_t>(params.order_type)),
                tx.pure(static_cast<uint8_t>(params.self_matching_option)),
                tx.pure(input_price),
                tx.pure(input_quantity),
                tx.pure(params.is_bid),
                tx.pure(params.pay_with_deep),
                tx.pure(params.expiration),
                add_input(tx, clock_obj, "clock", CLOCK_OBJECT_ID),
            };
            return tx.move_call(package, functions::PLACE_LIMIT_ORDER, std::move(type_args),
                                std::move(args));
        });
    });
}

std::future<Argument> DeepBookContract::place_market_order(TransactionBuilder& tx,
                                                           const PlaceMarketOrderParams& params) {
    return std::async(std::launch::async, [this, &tx, params]() {
        std::string op = describe_op("place_market_order", {{"pool", params.pool_key},
                                                            {"manager", params.balance_manager_key}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(params.pool_key);
            BalanceManager manager = require_balance_manager(params.balance_manager_key);
            auto [base, quote] = pool_coins(params.pool_key);

            uint64_t client_order_id = parse_u64(params.client_order_id, "client order id");
            uint64_t input_quantity = to_units(params.quantity, base);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, true);
            auto manager_obj = resolve_manager(params.balance_manager_key, manager, true);
            auto clock_obj = resolve_clock();

            Argument pool_arg = add_input(tx, pool_obj, "pool", params.pool_key);
            auto [manager_arg, proof] = add_manager_with_proof(tx, manager_obj);

            std::vector<Argument> args{
                pool_arg,
                manager_arg,
                proof,
                tx.pure(client_order_id),
                tx.pure(static_cast<uint8_t>(params.self_matching_option)),
                tx.pure(input_quantity),
                tx.pure(params.is_bid),
                tx.pure(params.pay_with_deep),
                add_input(tx, clock_obj, "clock", CLOCK_OBJECT_ID),
            };
            return tx.move_call(package, functions::PLACE_MARKET_ORDER, std::move(type_args),
                                std::move(args));
        });
    });
}

std::future<Argument> DeepBookContract::modify_order(TransactionBuilder& tx,
                                                     const std::string& pool_key,
                                                     const std::string& balance_manager_key,
                                                     const std::string& order_id,
                                                     Decimal new_quantity) {
    return std::async(std::launch::async,
                      [this, &tx, pool_key, balance_manager_key, order_id, new_quantity]() {
        std::string op = describe_op("modify_order", {{"pool", pool_key},
                                                      {"manager", balance_manager_key},
                                                      {"order", order_id}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(pool_key);
            BalanceManager manager = require_balance_manager(balance_manager_key);
            auto [base, quote] = pool_coins(pool_key);

            U128 id = parse_u128(order_id, "order id");
            uint64_t input_quantity = to_units(new_quantity, base);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, true);
            auto manager_obj = resolve_manager(balance_manager_key, manager, true);
            auto clock_obj = resolve_clock();

            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);
            auto [manager_arg, proof] = add_manager_with_proof(tx, manager_obj);

            std::vector<Argument> args{
                pool_arg,
                manager_arg,
                proof,
                tx.pure(id),
                tx.pure(input_quantity),
                add_input(tx, clock_obj, "clock", CLOCK_OBJECT_ID),
            };
            return tx.move_call(package, functions::MODIFY_ORDER, std::move(type_args),
                                std::move(args));
        });
    });
}

std::future<Argument> DeepBookContract::cancel_order(TransactionBuilder& tx,
                                                     const std::string& pool_key,
                                                     const std::string& balance_manager_key,
                                                     const std::string& order_id) {
    return std::async(std::launch::async, [this, &tx, pool_key, balance_manager_key, order_id]() {
        std::string op = describe_op("cancel_order", {{"pool", pool_key},
                                                      {"manager", balance_manager_key},
                                                      {"order", order_id}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(pool_key);
            BalanceManager manager = require_balance_manager(balance_manager_key);
            auto [base, quote] = pool_coins(pool_key);

            U128 id = parse_u128(order_id, "order id");
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, true);
            auto manager_obj = resolve_manager(balance_manager_key, manager, true);
            auto clock_obj = resolve_clock();

            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);
            auto [manager_arg, proof] = add_manager_with_proof(tx, manager_obj);

            std::vector<Argument> args{
                pool_arg,
                manager_arg,
                proof,
                tx.pure(id),
                add_input(tx, clock_obj, "clock", CLOCK_OBJECT_ID),
            };
            return tx.move_call(package, functions::CANCEL_ORDER, std::move(type_args),
                                std::move(args));
        });
    });
}

std::future<Argument> DeepBookContract::cancel_all_orders(TransactionBuilder& tx,
                                                          const std::string& pool_key,
                                                          const std::string& balance_manager_key) {
    return std::async(std::launch::async, [this, &tx, pool_key, balance_manager_key]() {
        std::string op = describe_op("cancel_all_orders", {{"pool", pool_key},
                                                           {"manager", balance_manager_key}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(pool_key);
            BalanceManager manager = require_balance_manager(balance_manager_key);
            auto [base, quote] = pool_coins(pool_key);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, true);
            auto manager_obj = resolve_manager(balance_manager_key, manager, true);
            auto clock_obj = resolve_clock();

            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);
            auto [manager_arg, proof] = add_manager_with_proof(tx, manager_obj);
            Argument clock_arg = add_input(tx, clock_obj, "clock", CLOCK_OBJECT_ID);

            return tx.move_call(package, functions::CANCEL_ALL_ORDERS, std::move(type_args),
                                {pool_arg, manager_arg, proof, clock_arg});
        });
    });
}

std::future<Argument> DeepBookContract::withdraw_settled_amounts(
    TransactionBuilder& tx, const std::string& pool_key, const std::string& balance_manager_key) {
    return std::async(std::launch::async, [this, &tx, pool_key, balance_manager_key]() {
        std::string op = describe_op("withdraw_settled_amounts",
                                     {{"pool", pool_key}, {"manager", balance_manager_key}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(pool_key);
            BalanceManager manager = require_balance_manager(balance_manager_key);
            auto [base, quote] = pool_coins(pool_key);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, true);
            auto manager_obj = resolve_manager(balance_manager_key, manager, true);

            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);
            auto [manager_arg, proof] = add_manager_with_proof(tx, manager_obj);

            return tx.move_call(package, functions::WITHDRAW_SETTLED_AMOUNTS, std::move(type_args),
                                {pool_arg, manager_arg, proof});
        });
    });
}

std::future<Argument> DeepBookContract::account_open_orders(TransactionBuilder& tx,
                                                            const std::string& pool_key,
                                                            const std::string& balance_manager_key) {
    return std::async(std::launch::async, [this, &tx, pool_key, balance_manager_key]() {
        std::string op = describe_op("account_open_orders", {{"pool", pool_key},
                                                             {"manager", balance_manager_key}});
        return compose(tx, op, [&]() {
            Pool pool = require_pool(pool_key);
            BalanceManager manager = require_balance_manager(balance_manager_key);
            auto [base, quote] = pool_coins(pool_key);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            // Read-only: no proof, nothing mutated
            auto pool_obj = resolve_pool(pool, false);
            auto manager_obj = resolver_->resolve_shared(manager.address, false);

            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);
            Argument manager_arg = add_input(tx, manager_obj, "balance manager", balance_manager_key);

            return tx.move_call(package, functions::ACCOUNT_OPEN_ORDERS, std::move(type_args),
                                {pool_arg, manager_arg});
        });
    });
}

std::future<Argument> DeepBookContract::whitelisted(TransactionBuilder& tx,
                                                    const std::string& pool_key) {
    return std::async(std::launch::async, [this, &tx, pool_key]() {
        return compose(tx, describe_op("whitelisted", {{"pool", pool_key}}), [&]() {
            Pool pool = require_pool(pool_key);
            auto [base, quote] = pool_coins(pool_key);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, false);
            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);

            return tx.move_call(package, functions::WHITELISTED, std::move(type_args), {pool_arg});
        });
    });
}

std::future<Argument> DeepBookContract::mid_price(TransactionBuilder& tx,
                                                  const std::string& pool_key) {
    return std::async(std::launch::async, [this, &tx, pool_key]() {
        return compose(tx, describe_op("mid_price", {{"pool", pool_key}}), [&]() {
            Pool pool = require_pool(pool_key);
            auto [base, quote] = pool_coins(pool_key);
            std::vector<TypeTag> type_args{coin_type(base), coin_type(quote)};
            ObjectId package = package_id();

            auto pool_obj = resolve_pool(pool, false);
            auto clock_obj = resolve_clock();

            Argument pool_arg = add_input(tx, pool_obj, "pool", pool_key);
            Argument clock_arg = add_input(tx, clock_obj, "clock", CLOCK_OBJECT_ID);

            return tx.move_call(package, functions::MID_PRICE, std::move(type_args),
                                {pool_arg, clock_arg});
        });
    });
}

}  // namespace deepbook
