// DeepBook SDK - Programmable Transactions
// Append-only argument buffer, move call schemas and wire encoding

#pragma once

#include <deepbook/bcs.hpp>
#include <deepbook/object_id.hpp>
#include <deepbook/type_tag.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace deepbook {

/* Inputs */

struct ObjectRef {
    ObjectId object_id;
    uint64_t version = 0;
    ObjectDigest digest{};

    bool operator==(const ObjectRef& rhs) const {
        return object_id == rhs.object_id && version == rhs.version && digest == rhs.digest;
    }
};

// Exclusively owned (or immutable) object, pinned to an exact version
struct ImmOrOwnedObject {
    ObjectRef ref;

    bool operator==(const ImmOrOwnedObject& rhs) const { return ref == rhs.ref; }
};

// Shared object; the ledger sequences conflicting uses
struct SharedObject {
    ObjectId object_id;
    uint64_t initial_shared_version = 0;
    bool is_mutable = false;

    bool operator==(const SharedObject& rhs) const {
        return object_id == rhs.object_id &&
               initial_shared_version == rhs.initial_shared_version &&
               is_mutable == rhs.is_mutable;
    }
};

using ObjectArg = std::variant<ImmOrOwnedObject, SharedObject>;

const ObjectId& object_id_of(const ObjectArg& arg) noexcept;

// BCS-encoded primitive value
struct PureArg {
    std::vector<uint8_t> bytes;

    bool operator==(const PureArg& rhs) const { return bytes == rhs.bytes; }
};

using CallArg = std::variant<PureArg, ObjectArg>;

/* Arguments and commands */

struct Argument {
    enum class Kind : uint8_t {
        GasCoin = 0,
        Input = 1,
        Result = 2,
        NestedResult = 3
    };

    Kind kind = Kind::GasCoin;
    uint16_t index = 0;
    uint16_t nested = 0;

    static constexpr Argument gas_coin() noexcept { return Argument{Kind::GasCoin, 0, 0}; }
    static constexpr Argument input(uint16_t i) noexcept { return Argument{Kind::Input, i, 0}; }
    static constexpr Argument result(uint16_t i) noexcept { return Argument{Kind::Result, i, 0}; }
    static constexpr Argument nested_result(uint16_t i, uint16_t j) noexcept {
        return Argument{Kind::NestedResult, i, j};
    }

    bool operator==(const Argument& rhs) const noexcept {
        return kind == rhs.kind && index == rhs.index && nested == rhs.nested;
    }
    bool operator!=(const Argument& rhs) const noexcept { return !(*this == rhs); }
};

struct MoveCall {
    ObjectId package;
    std::string module;
    std::string function;
    std::vector<TypeTag> type_arguments;
    std::vector<Argument> arguments;
};

struct TransferObjects {
    std::vector<Argument> objects;
    Argument recipient;
};

struct SplitCoins {
    Argument coin;
    std::vector<Argument> amounts;
};

struct MergeCoins {
    Argument destination;
    std::vector<Argument> sources;
};

// Alternative order is the wire tag
using Command = std::variant<MoveCall, TransferObjects, SplitCoins, MergeCoins>;

// Finalized, immutable call sequence
struct ProgrammableTransaction {
    std::vector<CallArg> inputs;
    std::vector<Command> commands;

    // BCS of TransactionKind::ProgrammableTransaction, the dry-run payload
    [[nodiscard]] std::vector<uint8_t> transaction_kind_bytes() const;
};

/* Move call schemas */

enum class ParamKind : uint8_t {
    Object,  // object input
    Pure,    // primitive input
    Result   // output of an earlier command
};

// Declared parameter list of an on-chain function
struct MoveFunction {
    const char* module;
    const char* function;
    std::vector<ParamKind> params;
    size_t type_arity = 0;

    [[nodiscard]] std::string name() const { return std::string(module) + "::" + function; }
};

/* Builder */

// Ordered, single-use argument buffer. Not thread-safe: one composition at a time.
class TransactionBuilder {
public:
    TransactionBuilder() = default;

    template <typename T>
    Argument pure(const T& value) {
        return pure_bytes(bcs::to_bytes(value));
    }

    Argument pure_bytes(std::vector<uint8_t> bytes);

    // Same object twice yields one input; a shared input used mutably anywhere becomes mutable
    Argument object(const ObjectArg& arg);

    // Throws SchemaError when args or type_args disagree with fn
    Argument move_call(const ObjectId& package, const MoveFunction& fn,
                       std::vector<TypeTag> type_args, std::vector<Argument> args);

    Argument transfer_objects(std::vector<Argument> objects, Argument recipient);

    // One nested result per amount
    std::vector<Argument> split_coins(Argument coin, std::vector<Argument> amounts);

    Argument merge_coins(Argument destination, std::vector<Argument> sources);

    // Seals the buffer; any later append or finish throws BuilderError
    ProgrammableTransaction finish();

    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] const std::vector<CallArg>& inputs() const noexcept { return inputs_; }
    [[nodiscard]] const std::vector<Command>& commands() const noexcept { return commands_; }

private:
    friend class BuilderCheckpoint;

    void ensure_open() const;
    void check_argument(const Argument& arg) const;
    Argument push_command(Command cmd);

    std::vector<CallArg> inputs_;
    std::vector<Command> commands_;
    std::unordered_map<ObjectId, uint16_t> object_index_;
    bool finished_ = false;
};

// Restores the builder to its state at construction unless commit() is called
class BuilderCheckpoint {
public:
    explicit BuilderCheckpoint(TransactionBuilder& tx);
    ~BuilderCheckpoint();

    BuilderCheckpoint(const BuilderCheckpoint&) = delete;
    BuilderCheckpoint& operator=(const BuilderCheckpoint&) = delete;

    void commit() noexcept { committed_ = true; }

private:
    TransactionBuilder& tx_;
    std::vector<CallArg> inputs_;
    std::unordered_map<ObjectId, uint16_t> object_index_;
    size_t command_count_;
    bool committed_ = false;
};

namespace bcs {

void to_bcs(Writer& w, const ObjectRef& ref);
void to_bcs(Writer& w, const ObjectArg& arg);
void to_bcs(Writer& w, const CallArg& arg);
void to_bcs(Writer& w, const Argument& arg);
void to_bcs(Writer& w, const Command& cmd);
void to_bcs(Writer& w, const ProgrammableTransaction& tx);

}  // namespace bcs

}  // namespace deepbook
