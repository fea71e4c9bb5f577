// DeepBook SDK - Configuration Implementation

#include <deepbook/config.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/log.hpp>
#include <deepbook/types.hpp>
#include <fstream>
#include <sstream>

namespace deepbook {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

}  // namespace

Environment parse_environment(std::string_view name) noexcept {
    return name == "mainnet" ? Environment::Mainnet : Environment::Testnet;
}

const char* default_rpc_url(Environment env) noexcept {
    return env == Environment::Mainnet ? "https://fullnode.mainnet.sui.io:443"
                                       : "https://fullnode.testnet.sui.io:443";
}

DeepBookConfig::DeepBookConfig(std::string_view env, std::string address,
                               std::optional<std::string> admin_cap,
                               std::optional<BalanceManagerMap> balance_managers,
                               std::optional<CoinMap> coins,
                               std::optional<PoolMap> pools)
    : env_(parse_environment(env)),
      address_(std::move(address)),
      admin_cap_(std::move(admin_cap)) {
    if (env != "mainnet" && env != "testnet") {
        log::logger()->warn("Unknown environment '{}', using testnet defaults", env);
    }
    const bool mainnet = env_ == Environment::Mainnet;
    const PackageIds& ids = mainnet ? MAINNET_PACKAGE_IDS : TESTNET_PACKAGE_IDS;

    deepbook_package_id_ = ids.deepbook_package_id;
    registry_id_ = ids.registry_id;
    deep_treasury_id_ = ids.deep_treasury_id;
    rpc_url_ = default_rpc_url(env_);

    if (coins) coins_ = std::move(*coins);
    else coins_ = mainnet ? mainnet_coins() : testnet_coins();

    if (pools) pools_ = std::move(*pools);
    else pools_ = mainnet ? mainnet_pools() : testnet_pools();

    if (balance_managers) balance_managers_ = std::move(*balance_managers);

    validate();
}

DeepBookConfig DeepBookConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

DeepBookConfig DeepBookConfig::from_toml(std::string_view content) {
    std::string env = "testnet";
    std::string address;
    std::optional<std::string> admin_cap;
    std::optional<std::string> rpc_url;
    std::optional<std::string> log_level;
    std::optional<BalanceManagerMap> managers;
    std::optional<CoinMap> coins;
    std::optional<PoolMap> pools;

    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }

            // A named entry replaces the environment's default table
            if (!current_subsection.empty()) {
                if (current_section == "balance_managers") {
                    if (!managers) managers.emplace();
                    (*managers)[current_subsection];
                } else if (current_section == "coins") {
                    if (!coins) coins.emplace();
                    (*coins)[current_subsection];
                } else if (current_section == "pools") {
                    if (!pools) pools.emplace();
                    (*pools)[current_subsection];
                }
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "env") env = value;
            else if (key == "address") address = value;
            else if (key == "admin_cap") admin_cap = value;
            else if (key == "rpc_url") rpc_url = value;
            else if (key == "log_level") log_level = value;
        }
        else if (current_section == "balance_managers" && managers) {
            auto& manager = (*managers)[current_subsection];
            if (key == "address") manager.address = value;
            else if (key == "trade_cap") manager.access = DelegatedAccess{value};
        }
        else if (current_section == "coins" && coins) {
            auto& coin = (*coins)[current_subsection];
            if (key == "address") coin.address = value;
            else if (key == "type") coin.type = value;
            else if (key == "scalar") {
                try {
                    coin.scalar = parse_u64(value, "scalar");
                } catch (const ParseError&) {
                    std::throw_with_nested(
                        ConfigError("Invalid scalar for coin " + current_subsection));
                }
            }
        }
        else if (current_section == "pools" && pools) {
            auto& pool = (*pools)[current_subsection];
            if (key == "address") pool.address = value;
            else if (key == "base_coin") pool.base_coin = value;
            else if (key == "quote_coin") pool.quote_coin = value;
        }
    }

    DeepBookConfig config(env, address, admin_cap, std::move(managers),
                          std::move(coins), std::move(pools));
    if (rpc_url) config.with_rpc_url(*rpc_url);
    if (log_level) config.with_log_level(*log_level);
    return config;
}

std::optional<Coin> DeepBookConfig::get_coin(std::string_view key) const {
    auto it = coins_.find(std::string(key));
    if (it == coins_.end()) return std::nullopt;
    return it->second;
}

std::optional<Pool> DeepBookConfig::get_pool(std::string_view key) const {
    auto it = pools_.find(std::string(key));
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::optional<BalanceManager> DeepBookConfig::get_balance_manager(std::string_view key) const {
    auto it = balance_managers_.find(std::string(key));
    if (it == balance_managers_.end()) return std::nullopt;
    return it->second;
}

DeepBookConfig& DeepBookConfig::with_balance_manager(std::string_view key, BalanceManager manager) {
    balance_managers_[std::string(key)] = std::move(manager);
    return *this;
}

DeepBookConfig& DeepBookConfig::with_coin(std::string_view key, Coin coin) {
    if (coin.scalar == 0) {
        throw ConfigError("Coin " + std::string(key) + " has no scalar");
    }
    coins_[std::string(key)] = std::move(coin);
    return *this;
}

DeepBookConfig& DeepBookConfig::with_pool(std::string_view key, Pool pool) {
    if (coins_.count(pool.base_coin) == 0 || coins_.count(pool.quote_coin) == 0) {
        throw ConfigError("Pool " + std::string(key) + " references unknown coin " +
                          (coins_.count(pool.base_coin) == 0 ? pool.base_coin : pool.quote_coin));
    }
    pools_[std::string(key)] = std::move(pool);
    return *this;
}

DeepBookConfig& DeepBookConfig::with_rpc_url(std::string_view url) {
    rpc_url_ = std::string(url);
    return *this;
}

DeepBookConfig& DeepBookConfig::with_log_level(std::string_view level) {
    log_level_ = std::string(level);
    return *this;
}

void DeepBookConfig::validate() const {
    for (const auto& [key, coin] : coins_) {
        if (coin.scalar == 0) throw ConfigError("Coin " + key + " has no scalar");
    }
    for (const auto& [key, pool] : pools_) {
        if (coins_.count(pool.base_coin) == 0) {
            throw ConfigError("Pool " + key + " references unknown base coin " + pool.base_coin);
        }
        if (coins_.count(pool.quote_coin) == 0) {
            throw ConfigError("Pool " + key + " references unknown quote coin " + pool.quote_coin);
        }
    }
}

}  // namespace deepbook
