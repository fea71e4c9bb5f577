// DeepBook SDK - Read-Only Simulation
// Dry-runs a bundle and decodes the first return value of its first call

#pragma once

#include <deepbook/bcs.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/ledger.hpp>
#include <deepbook/transaction.hpp>
#include <future>
#include <memory>

namespace deepbook {

class SimulationExecutor {
public:
    SimulationExecutor(std::shared_ptr<LedgerClient> ledger, SuiAddress sender);

    // Finishes tx and evaluates it without committing. The future fails with
    // ExecutionFailedError, MissingResultsError, MissingCommandResultError,
    // MissingReturnValueError, or a SimulationError wrapping the DecodeError.
    template <typename T>
    std::future<T> simulate(TransactionBuilder& tx) {
        auto raw = simulate_raw(tx);
        return std::async(std::launch::async, [raw = std::move(raw)]() mutable {
            std::vector<uint8_t> bytes = raw.get();
            try {
                return bcs::from_bytes<T>(bytes);
            } catch (const DecodeError&) {
                std::throw_with_nested(SimulationError("Cannot decode first return value"));
            }
        });
    }

    // Undecoded bytes of the first return value of the first call
    std::future<std::vector<uint8_t>> simulate_raw(TransactionBuilder& tx);

    [[nodiscard]] const SuiAddress& sender() const noexcept { return sender_; }

private:
    std::shared_ptr<LedgerClient> ledger_;
    SuiAddress sender_;
};

// Applies the result checks in order: execution error, results, first call, first value
std::vector<uint8_t> first_return_value(const DevInspectResult& result);

}  // namespace deepbook
