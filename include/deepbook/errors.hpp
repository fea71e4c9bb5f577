// DeepBook SDK - Error Types
// Exception hierarchy and nested-cause helpers

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace deepbook {

// Base for every error raised by the SDK
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid configuration table or unreadable configuration source
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

// Symbolic key absent from the active registry
class LookupError : public Error {
public:
    LookupError(std::string_view kind, std::string_view key)
        : Error(std::string(kind) + " not found for key: " + std::string(key)),
          kind_(kind), key_(key) {}

    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string kind_;
    std::string key_;
};

// Malformed address, type tag, decimal or numeric identifier
class ParseError : public Error {
public:
    explicit ParseError(const std::string& msg) : Error(msg) {}
};

// Value cannot be represented in the target integer width
class AmountOverflowError : public Error {
public:
    explicit AmountOverflowError(const std::string& msg) : Error(msg) {}
};

// Transport or remote ledger failure
class FetchError : public Error {
public:
    explicit FetchError(const std::string& msg) : Error(msg) {}
};

// Fetched ownership kind disagrees with what the call requires
class OwnershipMismatchError : public Error {
public:
    OwnershipMismatchError(std::string object_id, std::string expected, std::string actual)
        : Error("Object " + object_id + ": expected " + expected +
                " object, found " + actual),
          object_id_(std::move(object_id)),
          expected_(std::move(expected)),
          actual_(std::move(actual)) {}

    [[nodiscard]] const std::string& object_id() const noexcept { return object_id_; }
    [[nodiscard]] const std::string& expected() const noexcept { return expected_; }
    [[nodiscard]] const std::string& actual() const noexcept { return actual_; }

private:
    std::string object_id_;
    std::string expected_;
    std::string actual_;
};

// No single owned coin of the requested type covers the amount
class InsufficientBalanceError : public Error {
public:
    explicit InsufficientBalanceError(const std::string& msg) : Error(msg) {}
};

// Move call arguments do not match the declared parameter list
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& msg) : Error(msg) {}
};

// Append or finish on an already finalized transaction builder
class BuilderError : public Error {
public:
    explicit BuilderError(const std::string& msg) : Error(msg) {}
};

// BCS payload does not match the expected shape
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& msg) : Error(msg) {}
};

// A composer operation failed; the cause is nested
class CompositionError : public Error {
public:
    explicit CompositionError(const std::string& msg) : Error(msg) {}
};

// Dry-run evaluation failures
class SimulationError : public Error {
public:
    explicit SimulationError(const std::string& msg) : Error(msg) {}
};

class MissingResultsError : public SimulationError {
public:
    MissingResultsError() : SimulationError("Simulation returned no results") {}
};

class MissingCommandResultError : public SimulationError {
public:
    MissingCommandResultError() : SimulationError("Simulation returned no result for the first call") {}
};

class MissingReturnValueError : public SimulationError {
public:
    MissingReturnValueError() : SimulationError("First call returned no values") {}
};

class ExecutionFailedError : public SimulationError {
public:
    explicit ExecutionFailedError(const std::string& reason)
        : SimulationError("Simulated execution failed: " + reason) {}
};

// Render "outer: caused by: inner: ..." for a nested exception chain
std::string error_chain(const std::exception& e);

// True if any exception in the chain of e (including e) is a T
template <typename T>
bool has_cause(const std::exception& e) {
    if (dynamic_cast<const T*>(&e) != nullptr) return true;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        return has_cause<T>(inner);
    } catch (...) {
        return false;
    }
    return false;
}

}  // namespace deepbook
