// DeepBook SDK - Configuration
// Per-network registry of coins, pools and balance managers, with fluent overrides

#pragma once

#include <deepbook/constants.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace deepbook {

enum class Environment {
    Mainnet,
    Testnet
};

// "mainnet" selects mainnet; any other name selects testnet
Environment parse_environment(std::string_view name) noexcept;

inline constexpr const char* to_string(Environment env) noexcept {
    return env == Environment::Mainnet ? "mainnet" : "testnet";
}

// Caller owns the balance manager directly
struct OwnerAccess {};

// Caller acts through a trade capability minted by the owner
struct DelegatedAccess {
    std::string trade_cap;
};

using AccountAccess = std::variant<OwnerAccess, DelegatedAccess>;

// Account reference
struct BalanceManager {
    std::string address;
    AccountAccess access = OwnerAccess{};

    static BalanceManager owned(std::string_view address) {
        return BalanceManager{std::string(address), OwnerAccess{}};
    }

    static BalanceManager delegated(std::string_view address, std::string_view trade_cap) {
        return BalanceManager{std::string(address), DelegatedAccess{std::string(trade_cap)}};
    }

    [[nodiscard]] bool is_delegated() const noexcept {
        return std::holds_alternative<DelegatedAccess>(access);
    }
};

using BalanceManagerMap = std::unordered_map<std::string, BalanceManager>;

// Network configuration and registry. Lookups are pure and never throw.
class DeepBookConfig {
public:
    // Tables left empty are taken from the environment defaults.
    // Throws ConfigError if a pool names a coin missing from the coin table
    // or a coin has a zero scalar.
    DeepBookConfig(std::string_view env, std::string address,
                   std::optional<std::string> admin_cap = std::nullopt,
                   std::optional<BalanceManagerMap> balance_managers = std::nullopt,
                   std::optional<CoinMap> coins = std::nullopt,
                   std::optional<PoolMap> pools = std::nullopt);

    // Load from TOML
    static DeepBookConfig from_file(std::string_view path);
    static DeepBookConfig from_toml(std::string_view content);

    [[nodiscard]] std::optional<Coin> get_coin(std::string_view key) const;
    [[nodiscard]] std::optional<Pool> get_pool(std::string_view key) const;
    [[nodiscard]] std::optional<BalanceManager> get_balance_manager(std::string_view key) const;

    DeepBookConfig& with_balance_manager(std::string_view key, BalanceManager manager);
    DeepBookConfig& with_coin(std::string_view key, Coin coin);
    // Throws ConfigError if base or quote coin is unknown
    DeepBookConfig& with_pool(std::string_view key, Pool pool);
    DeepBookConfig& with_rpc_url(std::string_view url);
    DeepBookConfig& with_log_level(std::string_view level);

    // Throws ConfigError on dangling coin references and zero scalars
    void validate() const;

    [[nodiscard]] Environment environment() const noexcept { return env_; }
    [[nodiscard]] const std::string& address() const noexcept { return address_; }
    [[nodiscard]] const std::optional<std::string>& admin_cap() const noexcept { return admin_cap_; }
    [[nodiscard]] const std::string& deepbook_package_id() const noexcept { return deepbook_package_id_; }
    [[nodiscard]] const std::string& registry_id() const noexcept { return registry_id_; }
    [[nodiscard]] const std::string& deep_treasury_id() const noexcept { return deep_treasury_id_; }
    [[nodiscard]] const std::string& rpc_url() const noexcept { return rpc_url_; }
    [[nodiscard]] const std::string& log_level() const noexcept { return log_level_; }

    [[nodiscard]] const CoinMap& coins() const noexcept { return coins_; }
    [[nodiscard]] const PoolMap& pools() const noexcept { return pools_; }
    [[nodiscard]] const BalanceManagerMap& balance_managers() const noexcept { return balance_managers_; }

private:
    Environment env_;
    std::string address_;
    std::optional<std::string> admin_cap_;
    std::string deepbook_package_id_;
    std::string registry_id_;
    std::string deep_treasury_id_;
    std::string rpc_url_;
    std::string log_level_ = "info";

    CoinMap coins_;
    PoolMap pools_;
    BalanceManagerMap balance_managers_;
};

// Default fullnode endpoint for an environment
const char* default_rpc_url(Environment env) noexcept;

}  // namespace deepbook
