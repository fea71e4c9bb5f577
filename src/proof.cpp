// DeepBook SDK - Trade Proofs Implementation

#include <deepbook/proof.hpp>
#include <deepbook/functions.hpp>
#include <type_traits>

namespace deepbook {

Argument derive_proof(TransactionBuilder& tx, const ObjectId& package, Argument manager,
                      const ProofAuthority& authority) {
    return std::visit(
        [&](const auto& auth) {
            using T = std::decay_t<decltype(auth)>;
            if constexpr (std::is_same_v<T, TraderProof>) {
                return tx.move_call(package, functions::GENERATE_PROOF_AS_TRADER, {},
                                    {manager, auth.trade_cap});
            } else {
                return tx.move_call(package, functions::GENERATE_PROOF_AS_OWNER, {}, {manager});
            }
        },
        authority);
}

Argument derive_proof(TransactionBuilder& tx, const ObjectId& package, Argument manager,
                      std::optional<Argument> trade_cap) {
    if (trade_cap) {
        return derive_proof(tx, package, manager, TraderProof{*trade_cap});
    }
    return derive_proof(tx, package, manager, OwnerProof{});
}

}  // namespace deepbook
