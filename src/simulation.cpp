// DeepBook SDK - Read-Only Simulation Implementation

#include <deepbook/simulation.hpp>
#include <deepbook/log.hpp>

namespace deepbook {

std::vector<uint8_t> first_return_value(const DevInspectResult& result) {
    if (result.error) {
        throw ExecutionFailedError(*result.error);
    }
    if (!result.results) {
        throw MissingResultsError();
    }
    if (result.results->empty()) {
        throw MissingCommandResultError();
    }
    const auto& first = result.results->front();
    if (first.return_values.empty()) {
        throw MissingReturnValueError();
    }
    return first.return_values.front().bytes;
}

SimulationExecutor::SimulationExecutor(std::shared_ptr<LedgerClient> ledger, SuiAddress sender)
    : ledger_(std::move(ledger)), sender_(sender) {}

std::future<std::vector<uint8_t>> SimulationExecutor::simulate_raw(TransactionBuilder& tx) {
    ProgrammableTransaction ptx = tx.finish();

    return std::async(std::launch::async, [ledger = ledger_, sender = sender_,
                                           ptx = std::move(ptx)]() {
        log::logger()->debug("dry run of {} commands as {}", ptx.commands.size(),
                             short_hex(sender));
        DevInspectResult result;
        try {
            result = ledger->dev_inspect(sender, ptx).get();
        } catch (const std::exception&) {
            std::throw_with_nested(FetchError("Dry run failed"));
        }

        try {
            return first_return_value(result);
        } catch (const SimulationError& e) {
            log::logger()->warn("dry run rejected: {}", e.what());
            throw;
        }
    });
}

}  // namespace deepbook
