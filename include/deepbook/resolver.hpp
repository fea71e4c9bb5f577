// DeepBook SDK - Object Reference Resolver
// Turns an object address into a typed call input from its live ownership metadata

#pragma once

#include <deepbook/ledger.hpp>
#include <deepbook/transaction.hpp>
#include <future>
#include <memory>
#include <optional>
#include <string_view>

namespace deepbook {

// Ownership a call site demands of an object
enum class RequiredOwnership {
    Shared,  // pools, balance managers, the clock
    Owned,   // trade caps, coins; address-owned only
    Any
};

class ObjectResolver {
public:
    explicit ObjectResolver(std::shared_ptr<LedgerClient> ledger);

    // Parses the address immediately (ParseError is thrown here, before any remote read),
    // then performs exactly one get_object. The future fails with FetchError or
    // OwnershipMismatchError. Nothing is cached. With an expected owner set, an owned
    // object held by any other address is a mismatch as well.
    std::future<ObjectArg> resolve(std::string_view address, bool is_mutable,
                                   RequiredOwnership required = RequiredOwnership::Any,
                                   std::optional<SuiAddress> expected_owner = std::nullopt);

    std::future<ObjectArg> resolve_shared(std::string_view address, bool is_mutable) {
        return resolve(address, is_mutable, RequiredOwnership::Shared);
    }

    std::future<ObjectArg> resolve_owned(std::string_view address,
                                         std::optional<SuiAddress> owner = std::nullopt) {
        return resolve(address, true, RequiredOwnership::Owned, owner);
    }

    [[nodiscard]] const std::shared_ptr<LedgerClient>& ledger() const noexcept { return ledger_; }

private:
    std::shared_ptr<LedgerClient> ledger_;
};

// Builds the input for already fetched metadata; throws OwnershipMismatchError
ObjectArg to_object_arg(const ObjectInfo& info, bool is_mutable, RequiredOwnership required,
                        const std::optional<SuiAddress>& expected_owner = std::nullopt);

}  // namespace deepbook
