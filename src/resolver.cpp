// DeepBook SDK - Object Reference Resolver Implementation

#include <deepbook/resolver.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/log.hpp>

namespace deepbook {

namespace {

const char* to_string(RequiredOwnership required) noexcept {
    switch (required) {
        case RequiredOwnership::Shared: return "shared";
        case RequiredOwnership::Owned: return "owned";
        case RequiredOwnership::Any: return "any";
    }
    return "unknown";
}

}  // namespace

ObjectArg to_object_arg(const ObjectInfo& info, bool is_mutable, RequiredOwnership required,
                        const std::optional<SuiAddress>& expected_owner) {
    const bool shared = info.ownership == OwnershipKind::Shared;
    const bool address_owned = info.ownership == OwnershipKind::AddressOwner;

    if ((required == RequiredOwnership::Shared && !shared) ||
        (required == RequiredOwnership::Owned && !address_owned)) {
        throw OwnershipMismatchError(info.object_id.to_hex(), to_string(required),
                                     to_string(info.ownership));
    }

    if (expected_owner && address_owned && info.owner != expected_owner) {
        throw OwnershipMismatchError(
            info.object_id.to_hex(), "owned by " + expected_owner->to_hex(),
            info.owner ? "owned by " + info.owner->to_hex() : std::string("unknown owner"));
    }

    if (shared) {
        if (!info.initial_shared_version) {
            throw FetchError("Shared object " + info.object_id.to_hex() +
                             " has no initial shared version");
        }
        return SharedObject{info.object_id, *info.initial_shared_version, is_mutable};
    }
    return ImmOrOwnedObject{info.ref()};
}

ObjectResolver::ObjectResolver(std::shared_ptr<LedgerClient> ledger)
    : ledger_(std::move(ledger)) {}

std::future<ObjectArg> ObjectResolver::resolve(std::string_view address, bool is_mutable,
                                               RequiredOwnership required,
                                               std::optional<SuiAddress> expected_owner) {
    ObjectId id = ObjectId::from_hex(address);

    return std::async(std::launch::async,
                      [ledger = ledger_, id, is_mutable, required, expected_owner]() {
        ObjectInfo info;
        try {
            info = ledger->get_object(id).get();
        } catch (const std::exception&) {
            std::throw_with_nested(FetchError("Failed to fetch object " + id.to_hex()));
        }

        ObjectArg arg = to_object_arg(info, is_mutable, required, expected_owner);
        log::logger()->debug("resolved {} as {} v{}", short_hex(id), to_string(info.ownership),
                             info.initial_shared_version.value_or(info.version));
        return arg;
    });
}

}  // namespace deepbook
