// DeepBook SDK - Contract Composer Base Implementation

#include <deepbook/contract.hpp>
#include <deepbook/constants.hpp>
#include <deepbook/proof.hpp>

namespace deepbook {

ContractBase::ContractBase(const DeepBookConfig& config, std::shared_ptr<ObjectResolver> resolver)
    : config_(config), resolver_(std::move(resolver)) {}

Coin ContractBase::require_coin(std::string_view key) const {
    auto coin = config_.get_coin(key);
    if (!coin) throw LookupError("Coin", key);
    return *coin;
}

Pool ContractBase::require_pool(std::string_view key) const {
    auto pool = config_.get_pool(key);
    if (!pool) throw LookupError("Pool", key);
    return *pool;
}

BalanceManager ContractBase::require_balance_manager(std::string_view key) const {
    auto manager = config_.get_balance_manager(key);
    if (!manager) throw LookupError("BalanceManager", key);
    return *manager;
}

ObjectId ContractBase::package_id() const {
    return ObjectId::from_hex(config_.deepbook_package_id());
}

TypeTag ContractBase::coin_type(const Coin& coin) {
    return TypeTag::parse(coin.type);
}

ContractBase::PendingManager ContractBase::resolve_manager(std::string_view key,
                                                           const BalanceManager& manager,
                                                           bool with_trade_cap) {
    PendingManager pending;
    pending.key = std::string(key);
    pending.manager = resolver_->resolve_shared(manager.address, true);
    if (with_trade_cap) {
        if (const auto* delegated = std::get_if<DelegatedAccess>(&manager.access)) {
            pending.trade_cap = resolver_->resolve_owned(delegated->trade_cap,
                                                         SuiAddress::from_hex(config_.address()));
        }
    }
    return pending;
}

std::future<ObjectArg> ContractBase::resolve_pool(const Pool& pool, bool is_mutable) {
    return resolver_->resolve_shared(pool.address, is_mutable);
}

std::future<ObjectArg> ContractBase::resolve_clock() {
    return resolver_->resolve_shared(CLOCK_OBJECT_ID, false);
}

Argument ContractBase::add_input(TransactionBuilder& tx, std::future<ObjectArg>& pending,
                                 std::string_view kind, std::string_view key) {
    ObjectArg arg;
    try {
        arg = pending.get();
    } catch (const std::exception&) {
        std::throw_with_nested(Error("Failed to prepare " + std::string(kind) +
                                     " argument for key: " + std::string(key)));
    }
    return tx.object(arg);
}

ContractBase::ManagerArgs ContractBase::add_manager_with_proof(TransactionBuilder& tx,
                                                               PendingManager& pending) {
    Argument manager = add_input(tx, pending.manager, "balance manager", pending.key);

    std::optional<Argument> trade_cap;
    if (pending.trade_cap) {
        trade_cap = add_input(tx, *pending.trade_cap, "trade cap", pending.key);
    }
    return ManagerArgs{manager, derive_proof(tx, package_id(), manager, trade_cap)};
}

std::string describe_op(std::string_view op,
                        std::initializer_list<std::pair<std::string_view, std::string_view>> keys) {
    std::string out(op);
    out += '(';
    bool first = true;
    for (const auto& [name, value] : keys) {
        if (!first) out += ", ";
        first = false;
        out.append(name).append("=").append(value);
    }
    out += ')';
    return out;
}

}  // namespace deepbook
