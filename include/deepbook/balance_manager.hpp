// DeepBook SDK - Balance Manager Composer
// Account creation, funding, withdrawals, proofs and trade caps

#pragma once

#include <deepbook/contract.hpp>
#include <deepbook/types.hpp>
#include <future>
#include <string>
#include <vector>

namespace deepbook {

class BalanceManagerContract : public ContractBase {
public:
    BalanceManagerContract(const DeepBookConfig& config, std::shared_ptr<ObjectResolver> resolver);

    // new() followed by public_share_object; touches no remote state
    Argument create_and_share_balance_manager(TransactionBuilder& tx);

    // SUI is split from the gas coin; other coins from the first owned coin
    // holding at least the amount (InsufficientBalanceError otherwise)
    std::future<Argument> deposit_into_manager(TransactionBuilder& tx,
                                               const std::string& manager_key,
                                               const std::string& coin_key, Decimal amount);

    // Withdrawn coin is transferred to recipient
    std::future<Argument> withdraw_from_manager(TransactionBuilder& tx,
                                                const std::string& manager_key,
                                                const std::string& coin_key, Decimal amount,
                                                const std::string& recipient);

    std::future<Argument> withdraw_all_from_manager(TransactionBuilder& tx,
                                                    const std::string& manager_key,
                                                    const std::string& coin_key,
                                                    const std::string& recipient);

    // Returns u64 balance in coin units
    std::future<Argument> check_manager_balance(TransactionBuilder& tx,
                                                const std::string& manager_key,
                                                const std::string& coin_key);

    // Owner or trader proof, following the manager's access
    std::future<Argument> generate_proof(TransactionBuilder& tx, const std::string& manager_key);

    std::future<Argument> owner(TransactionBuilder& tx, const std::string& manager_key);
    std::future<Argument> id(TransactionBuilder& tx, const std::string& manager_key);

    std::future<Argument> mint_trade_cap(TransactionBuilder& tx, const std::string& manager_key);

    std::future<Argument> mint_and_transfer_trade_cap(TransactionBuilder& tx,
                                                      const std::string& manager_key,
                                                      const std::string& recipient);

private:
    // balance_manager call whose only argument is the manager
    std::future<Argument> manager_call(TransactionBuilder& tx, const std::string& manager_key,
                                       const MoveFunction& fn, std::vector<std::string> coin_keys,
                                       bool is_mutable);

    // Owned coin of coin_type with balance >= amount, paging through the caller's coins
    ObjectRef find_coin(const SuiAddress& owner, const std::string& coin_type, uint64_t amount);
};

}  // namespace deepbook
