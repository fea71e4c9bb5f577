// DeepBook SDK - Ledger Interface
// Remote reads the SDK depends on: object metadata, coin listing, dry runs

#pragma once

#include <deepbook/object_id.hpp>
#include <deepbook/transaction.hpp>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace deepbook {

enum class OwnershipKind {
    AddressOwner,
    ObjectOwner,
    Shared,
    Immutable
};

inline constexpr const char* to_string(OwnershipKind kind) noexcept {
    switch (kind) {
        case OwnershipKind::AddressOwner: return "address-owned";
        case OwnershipKind::ObjectOwner: return "object-owned";
        case OwnershipKind::Shared: return "shared";
        case OwnershipKind::Immutable: return "immutable";
    }
    return "unknown";
}

// Current metadata of one object
struct ObjectInfo {
    ObjectId object_id;
    uint64_t version = 0;
    ObjectDigest digest{};
    OwnershipKind ownership = OwnershipKind::AddressOwner;
    std::optional<SuiAddress> owner;  // holding address or parent object, when owned
    std::optional<uint64_t> initial_shared_version;  // set for shared objects
    std::optional<std::string> type;

    [[nodiscard]] ObjectRef ref() const { return ObjectRef{object_id, version, digest}; }
};

struct CoinInfo {
    std::string coin_type;
    ObjectRef ref;
    uint64_t balance = 0;
};

struct CoinPage {
    std::vector<CoinInfo> data;
    std::optional<std::string> next_cursor;
    bool has_next_page = false;
};

// One BCS-encoded return value and its Move type
struct ReturnValue {
    std::vector<uint8_t> bytes;
    std::string type;
};

struct CommandResult {
    std::vector<ReturnValue> return_values;
};

struct DevInspectResult {
    std::optional<std::string> error;
    std::optional<std::vector<CommandResult>> results;  // absent when the node returned none
};

// Remote ledger read interface. Failures surface as FetchError through the future.
class LedgerClient {
public:
    virtual ~LedgerClient() = default;

    virtual std::future<ObjectInfo> get_object(const ObjectId& id) = 0;

    virtual std::future<CoinPage> get_coins(const SuiAddress& owner,
                                            const std::string& coin_type,
                                            const std::optional<std::string>& cursor) = 0;

    // Evaluates the transaction without committing it
    virtual std::future<DevInspectResult> dev_inspect(const SuiAddress& sender,
                                                      const ProgrammableTransaction& tx) = 0;
};

}  // namespace deepbook
