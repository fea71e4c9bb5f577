// DeepBook SDK - Protocol Constants
// Scales, limits and the default per-network registry tables

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>

namespace deepbook {

// Fixed-point scale applied uniformly to every on-chain price
inline constexpr uint64_t FLOAT_SCALAR = 1'000'000'000ULL;

// Units per DEEP token
inline constexpr uint64_t DEEP_SCALAR = 1'000'000ULL;

// "No expiration" for resting orders
inline constexpr uint64_t MAX_TIMESTAMP = std::numeric_limits<uint64_t>::max();

// Default budget for submitted transactions, in MIST
inline constexpr uint64_t GAS_BUDGET = 250'000'000ULL;

// Shared system clock object
inline constexpr const char* CLOCK_OBJECT_ID = "0x6";

// Framework package hosting coin and transfer modules
inline constexpr const char* SUI_FRAMEWORK_ID = "0x2";

inline constexpr const char* SUI_COIN_TYPE = "0x2::sui::SUI";

// Asset descriptor
struct Coin {
    std::string address;
    std::string type;
    uint64_t scalar = 0;

    bool operator==(const Coin& rhs) const {
        return address == rhs.address && type == rhs.type && scalar == rhs.scalar;
    }
};

// Venue descriptor; base and quote refer to coin keys
struct Pool {
    std::string address;
    std::string base_coin;
    std::string quote_coin;

    bool operator==(const Pool& rhs) const {
        return address == rhs.address && base_coin == rhs.base_coin &&
               quote_coin == rhs.quote_coin;
    }
};

using CoinMap = std::unordered_map<std::string, Coin>;
using PoolMap = std::unordered_map<std::string, Pool>;

// Deployed contract coordinates
struct PackageIds {
    const char* deepbook_package_id;
    const char* registry_id;
    const char* deep_treasury_id;
};

extern const PackageIds TESTNET_PACKAGE_IDS;
extern const PackageIds MAINNET_PACKAGE_IDS;

// Immutable default tables, built on first use
const CoinMap& testnet_coins();
const PoolMap& testnet_pools();
const CoinMap& mainnet_coins();
const PoolMap& mainnet_pools();

}  // namespace deepbook
