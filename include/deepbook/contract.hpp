// DeepBook SDK - Contract Composer Base
// Registry lookups, input resolution and all-or-nothing composition shared by composers

#pragma once

#include <deepbook/config.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/log.hpp>
#include <deepbook/resolver.hpp>
#include <deepbook/transaction.hpp>
#include <deepbook/type_tag.hpp>
#include <future>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace deepbook {

class ContractBase {
public:
    [[nodiscard]] const DeepBookConfig& config() const noexcept { return config_; }

protected:
    ContractBase(const DeepBookConfig& config, std::shared_ptr<ObjectResolver> resolver);

    // Registry lookups; a miss throws LookupError
    [[nodiscard]] Coin require_coin(std::string_view key) const;
    [[nodiscard]] Pool require_pool(std::string_view key) const;
    [[nodiscard]] BalanceManager require_balance_manager(std::string_view key) const;

    [[nodiscard]] ObjectId package_id() const;
    [[nodiscard]] static TypeTag coin_type(const Coin& coin);

    // In-flight resolution of a balance manager and, when delegated, its trade cap
    struct PendingManager {
        std::string key;
        std::future<ObjectArg> manager;
        std::optional<std::future<ObjectArg>> trade_cap;
    };

    struct ManagerArgs {
        Argument manager;
        Argument proof;
    };

    PendingManager resolve_manager(std::string_view key, const BalanceManager& manager,
                                   bool with_trade_cap);
    std::future<ObjectArg> resolve_pool(const Pool& pool, bool is_mutable);
    std::future<ObjectArg> resolve_clock();

    // Waits for a resolution and appends it as an input; failures name the key
    static Argument add_input(TransactionBuilder& tx, std::future<ObjectArg>& pending,
                              std::string_view kind, std::string_view key);

    // Appends the manager (and trade cap) inputs followed by the proof call
    ManagerArgs add_manager_with_proof(TransactionBuilder& tx, PendingManager& pending);

    // Runs fn against tx inside a checkpoint. On failure the builder is restored and
    // the cause is rethrown nested in a CompositionError naming the operation.
    template <typename Fn>
    auto compose(TransactionBuilder& tx, const std::string& op, Fn&& fn) -> decltype(fn()) {
        try {
            BuilderCheckpoint checkpoint(tx);
            auto result = fn();
            checkpoint.commit();
            log::logger()->debug("composed {}", op);
            return result;
        } catch (const std::exception& e) {
            log::logger()->warn("{} rolled back: {}", op, e.what());
            std::throw_with_nested(CompositionError(op));
        }
    }

    const DeepBookConfig& config_;
    std::shared_ptr<ObjectResolver> resolver_;
};

// "op(pool=X, manager=Y)"-style label for error chains
std::string describe_op(std::string_view op,
                        std::initializer_list<std::pair<std::string_view, std::string_view>> keys);

}  // namespace deepbook
