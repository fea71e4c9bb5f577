// DeepBook SDK - Balance Manager Composer Implementation

#include <deepbook/balance_manager.hpp>
#include <deepbook/amount.hpp>
#include <deepbook/constants.hpp>
#include <deepbook/functions.hpp>

namespace deepbook {

BalanceManagerContract::BalanceManagerContract(const DeepBookConfig& config,
                                               std::shared_ptr<ObjectResolver> resolver)
    : ContractBase(config, std::move(resolver)) {}

Argument BalanceManagerContract::create_and_share_balance_manager(TransactionBuilder& tx) {
    return compose(tx, "create_and_share_balance_manager()", [&]() {
        ObjectId package = package_id();
        Argument manager = tx.move_call(package, functions::BALANCE_MANAGER_NEW, {}, {});

        StructTag manager_type{package, "balance_manager", "BalanceManager", {}};
        tx.move_call(ObjectId::from_hex(SUI_FRAMEWORK_ID), functions::PUBLIC_SHARE_OBJECT,
                     {TypeTag::structure(std::move(manager_type))}, {manager});
        return manager;
    });
}

ObjectRef BalanceManagerContract::find_coin(const SuiAddress& owner, const std::string& coin_type,
                                            uint64_t amount) {
    std::optional<std::string> cursor;
    do {
        CoinPage page;
        try {
            page = resolver_->ledger()->get_coins(owner, coin_type, cursor).get();
        } catch (const std::exception&) {
            std::throw_with_nested(FetchError("Failed to list " + coin_type + " coins of " +
                                              owner.to_hex()));
        }

        for (const auto& coin : page.data) {
            if (coin.balance >= amount) return coin.ref;
        }
        cursor = page.has_next_page ? page.next_cursor : std::nullopt;
    } while (cursor);

    throw InsufficientBalanceError("No " + coin_type + " coin of " + owner.to_hex() +
                                   " holds " + std::to_string(amount) + " units");
}

std::future<Argument> BalanceManagerContract::deposit_into_manager(TransactionBuilder& tx,
                                                                   const std::string& manager_key,
                                                                   const std::string& coin_key,
                                                                   Decimal amount) {
    return std::async(std::launch::async, [this, &tx, manager_key, coin_key, amount]() {
        std::string op = describe_op("deposit_into_manager", {{"manager", manager_key},
                                                              {"coin", coin_key}});
        return compose(tx, op, [&]() {
            BalanceManager manager = require_balance_manager(manager_key);
            Coin coin = require_coin(coin_key);
            uint64_t units = to_units(amount, coin);
            TypeTag type = coin_type(coin);
            ObjectId package = package_id();

            const bool is_sui = type == TypeTag::parse(SUI_COIN_TYPE);
            std::optional<SuiAddress> owner;
            if (!is_sui) owner = SuiAddress::from_hex(config_.address());

            auto manager_obj = resolver_->resolve_shared(manager.address, true);
            Argument manager_arg = add_input(tx, manager_obj, "balance manager", manager_key);

            Argument source = is_sui ? Argument::gas_coin()
                                     : tx.object(ImmOrOwnedObject{find_coin(*owner, coin.type, units)});
            Argument deposit = tx.split_coins(source, {tx.pure(units)}).front();

            return tx.move_call(package, functions::DEPOSIT, {type}, {manager_arg, deposit});
        });
    });
}

std::future<Argument> BalanceManagerContract::withdraw_from_manager(TransactionBuilder& tx,
                                                                    const std::string& manager_key,
                                                                    const std::string& coin_key,
                                                                    Decimal amount,
                                                                    const std::string& recipient) {
    return std::async(std::launch::async, [this, &tx, manager_key, coin_key, amount, recipient]() {
        std::string op = describe_op("withdraw_from_manager", {{"manager", manager_key},
                                                               {"coin", coin_key}});
        return compose(tx, op, [&]() {
            BalanceManager manager = require_balance_manager(manager_key);
            Coin coin = require_coin(coin_key);
            uint64_t units = to_units(amount, coin);
            SuiAddress to = SuiAddress::from_hex(recipient);
            TypeTag type = coin_type(coin);
            ObjectId package = package_id();

            auto manager_obj = resolver_->resolve_shared(manager.address, true);
            Argument manager_arg = add_input(tx, manager_obj, "balance manager", manager_key);

            Argument withdrawn = tx.move_call(package, functions::WITHDRAW, {type},
                                              {manager_arg, tx.pure(units)});
            tx.transfer_objects({withdrawn}, tx.pure(to));
            return withdrawn;
        });
    });
}

std::future<Argument> BalanceManagerContract::withdraw_all_from_manager(
    TransactionBuilder& tx, const std::string& manager_key, const std::string& coin_key,
    const std::string& recipient) {
    return std::async(std::launch::async, [this, &tx, manager_key, coin_key, recipient]() {
        std::string op = describe_op("withdraw_all_from_manager", {{"manager", manager_key},
                                                                   {"coin", coin_key}});
        return compose(tx, op, [&]() {
            BalanceManager manager = require_balance_manager(manager_key);
            Coin coin = require_coin(coin_key);
            SuiAddress to = SuiAddress::from_hex(recipient);
            TypeTag type = coin_type(coin);
            ObjectId package = package_id();

            auto manager_obj = resolver_->resolve_shared(manager.address, true);
            Argument manager_arg = add_input(tx, manager_obj, "balance manager", manager_key);

            Argument withdrawn = tx.move_call(package, functions::WITHDRAW_ALL, {type},
                                              {manager_arg});
            tx.transfer_objects({withdrawn}, tx.pure(to));
            return withdrawn;
        });
    });
}

std::future<Argument> BalanceManagerContract::manager_call(TransactionBuilder& tx,
                                                           const std::string& manager_key,
                                                           const MoveFunction& fn,
                                                           std::vector<std::string> coin_keys,
                                                           bool is_mutable) {
    return std::async(std::launch::async,
                      [this, &tx, manager_key, &fn, coin_keys = std::move(coin_keys), is_mutable]() {
        std::string op = describe_op(fn.function, {{"manager", manager_key}});
        return compose(tx, op, [&]() {
            BalanceManager manager = require_balance_manager(manager_key);
            std::vector<TypeTag> type_args;
            for (const auto& key : coin_keys) {
                type_args.push_back(coin_type(require_coin(key)));
            }
            ObjectId package = package_id();

            auto manager_obj = resolver_->resolve_shared(manager.address, is_mutable);
            Argument manager_arg = add_input(tx, manager_obj, "balance manager", manager_key);

            return tx.move_call(package, fn, std::move(type_args), {manager_arg});
        });
    });
}

std::future<Argument> BalanceManagerContract::check_manager_balance(TransactionBuilder& tx,
                                                                    const std::string& manager_key,
                                                                    const std::string& coin_key) {
    return manager_call(tx, manager_key, functions::BALANCE, {coin_key}, false);
}

std::future<Argument> BalanceManagerContract::generate_proof(TransactionBuilder& tx,
                                                             const std::string& manager_key) {
    return std::async(std::launch::async, [this, &tx, manager_key]() {
        return compose(tx, describe_op("generate_proof", {{"manager", manager_key}}), [&]() {
            BalanceManager manager = require_balance_manager(manager_key);
            auto pending = resolve_manager(manager_key, manager, true);
            return add_manager_with_proof(tx, pending).proof;
        });
    });
}

std::future<Argument> BalanceManagerContract::owner(TransactionBuilder& tx,
                                                    const std::string& manager_key) {
    return manager_call(tx, manager_key, functions::OWNER, {}, false);
}

std::future<Argument> BalanceManagerContract::id(TransactionBuilder& tx,
                                                 const std::string& manager_key) {
    return manager_call(tx, manager_key, functions::ID, {}, false);
}

std::future<Argument> BalanceManagerContract::mint_trade_cap(TransactionBuilder& tx,
                                                             const std::string& manager_key) {
    return manager_call(tx, manager_key, functions::MINT_TRADE_CAP, {}, true);
}

std::future<Argument> BalanceManagerContract::mint_and_transfer_trade_cap(
    TransactionBuilder& tx, const std::string& manager_key, const std::string& recipient) {
    return std::async(std::launch::async, [this, &tx, manager_key, recipient]() {
        std::string op = describe_op("mint_and_transfer_trade_cap", {{"manager", manager_key}});
        return compose(tx, op, [&]() {
            BalanceManager manager = require_balance_manager(manager_key);
            SuiAddress to = SuiAddress::from_hex(recipient);
            ObjectId package = package_id();

            auto manager_obj = resolver_->resolve_shared(manager.address, true);
            Argument manager_arg = add_input(tx, manager_obj, "balance manager", manager_key);

            Argument trade_cap = tx.move_call(package, functions::MINT_TRADE_CAP, {}, {manager_arg});
            tx.transfer_objects({trade_cap}, tx.pure(to));
            return trade_cap;
        });
    });
}

}  // namespace deepbook
