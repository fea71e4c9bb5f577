// DeepBook SDK - Trade Proofs
// Authorization argument for acting on a balance manager

#pragma once

#include <deepbook/object_id.hpp>
#include <deepbook/transaction.hpp>
#include <optional>
#include <variant>

namespace deepbook {

// Caller owns the manager
struct OwnerProof {};

// Caller presents a trade cap input
struct TraderProof {
    Argument trade_cap;
};

using ProofAuthority = std::variant<OwnerProof, TraderProof>;

// Appends generate_proof_as_owner(manager) or generate_proof_as_trader(manager, trade_cap)
// and returns the proof result
Argument derive_proof(TransactionBuilder& tx, const ObjectId& package, Argument manager,
                      const ProofAuthority& authority);

Argument derive_proof(TransactionBuilder& tx, const ObjectId& package, Argument manager,
                      std::optional<Argument> trade_cap);

}  // namespace deepbook
