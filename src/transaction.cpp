// DeepBook SDK - Programmable Transactions Implementation

#include <deepbook/transaction.hpp>
#include <deepbook/errors.hpp>
#include <limits>
#include <type_traits>
#include <utility>

namespace deepbook {

namespace {

constexpr size_t MAX_INDEX = std::numeric_limits<uint16_t>::max();

const char* to_string(ParamKind kind) noexcept {
    switch (kind) {
        case ParamKind::Object: return "object";
        case ParamKind::Pure: return "pure";
        case ParamKind::Result: return "result";
    }
    return "unknown";
}

}  // namespace

const ObjectId& object_id_of(const ObjectArg& arg) noexcept {
    if (const auto* owned = std::get_if<ImmOrOwnedObject>(&arg)) {
        return owned->ref.object_id;
    }
    return std::get<SharedObject>(arg).object_id;
}

std::vector<uint8_t> ProgrammableTransaction::transaction_kind_bytes() const {
    return bcs::to_bytes(*this);
}

/* TransactionBuilder */

void TransactionBuilder::ensure_open() const {
    if (finished_) {
        throw BuilderError("Transaction builder already finished");
    }
}

void TransactionBuilder::check_argument(const Argument& arg) const {
    switch (arg.kind) {
        case Argument::Kind::GasCoin:
            return;
        case Argument::Kind::Input:
            if (arg.index >= inputs_.size()) {
                throw SchemaError("Input " + std::to_string(arg.index) + " does not exist");
            }
            return;
        case Argument::Kind::Result:
        case Argument::Kind::NestedResult:
            if (arg.index >= commands_.size()) {
                throw SchemaError("Result of command " + std::to_string(arg.index) +
                                  " does not exist");
            }
            return;
    }
}

Argument TransactionBuilder::pure_bytes(std::vector<uint8_t> bytes) {
    ensure_open();
    if (inputs_.size() > MAX_INDEX) {
        throw BuilderError("Too many transaction inputs");
    }
    inputs_.emplace_back(PureArg{std::move(bytes)});
    return Argument::input(static_cast<uint16_t>(inputs_.size() - 1));
}

Argument TransactionBuilder::object(const ObjectArg& arg) {
    ensure_open();
    const ObjectId& id = object_id_of(arg);

    auto it = object_index_.find(id);
    if (it != object_index_.end()) {
        auto& existing = std::get<ObjectArg>(inputs_[it->second]);
        auto* shared = std::get_if<SharedObject>(&existing);
        const auto* incoming = std::get_if<SharedObject>(&arg);
        if (shared && incoming) {
            shared->is_mutable = shared->is_mutable || incoming->is_mutable;
        } else if ((shared == nullptr) != (incoming == nullptr)) {
            throw BuilderError("Object " + id.to_hex() +
                               " already added with a different ownership kind");
        }
        return Argument::input(it->second);
    }

    if (inputs_.size() > MAX_INDEX) {
        throw BuilderError("Too many transaction inputs");
    }
    inputs_.emplace_back(arg);
    auto index = static_cast<uint16_t>(inputs_.size() - 1);
    object_index_.emplace(id, index);
    return Argument::input(index);
}

Argument TransactionBuilder::move_call(const ObjectId& package, const MoveFunction& fn,
                                       std::vector<TypeTag> type_args,
                                       std::vector<Argument> args) {
    ensure_open();

    if (type_args.size() != fn.type_arity) {
        throw SchemaError(fn.name() + " expects " + std::to_string(fn.type_arity) +
                          " type arguments, got " + std::to_string(type_args.size()));
    }
    if (args.size() != fn.params.size()) {
        throw SchemaError(fn.name() + " expects " + std::to_string(fn.params.size()) +
                          " arguments, got " + std::to_string(args.size()));
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const Argument& arg = args[i];
        check_argument(arg);

        bool ok = false;
        switch (fn.params[i]) {
            case ParamKind::Object:
                ok = arg.kind == Argument::Kind::Input &&
                     std::holds_alternative<ObjectArg>(inputs_[arg.index]);
                break;
            case ParamKind::Pure:
                ok = arg.kind == Argument::Kind::Input &&
                     std::holds_alternative<PureArg>(inputs_[arg.index]);
                break;
            case ParamKind::Result:
                ok = arg.kind == Argument::Kind::Result ||
                     arg.kind == Argument::Kind::NestedResult ||
                     arg.kind == Argument::Kind::GasCoin;
                break;
        }
        if (!ok) {
            throw SchemaError(fn.name() + " argument " + std::to_string(i) + " must be " +
                              to_string(fn.params[i]));
        }
    }

    return push_command(MoveCall{package, fn.module, fn.function,
                                 std::move(type_args), std::move(args)});
}

Argument TransactionBuilder::transfer_objects(std::vector<Argument> objects, Argument recipient) {
    ensure_open();
    for (const auto& obj : objects) check_argument(obj);
    check_argument(recipient);
    return push_command(TransferObjects{std::move(objects), recipient});
}

std::vector<Argument> TransactionBuilder::split_coins(Argument coin, std::vector<Argument> amounts) {
    ensure_open();
    check_argument(coin);
    for (const auto& amount : amounts) check_argument(amount);

    size_t count = amounts.size();
    Argument cmd = push_command(SplitCoins{coin, std::move(amounts)});

    std::vector<Argument> coins;
    coins.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        coins.push_back(Argument::nested_result(cmd.index, static_cast<uint16_t>(i)));
    }
    return coins;
}

Argument TransactionBuilder::merge_coins(Argument destination, std::vector<Argument> sources) {
    ensure_open();
    check_argument(destination);
    for (const auto& src : sources) check_argument(src);
    return push_command(MergeCoins{destination, std::move(sources)});
}

Argument TransactionBuilder::push_command(Command cmd) {
    if (commands_.size() > MAX_INDEX) {
        throw BuilderError("Too many transaction commands");
    }
    commands_.push_back(std::move(cmd));
    return Argument::result(static_cast<uint16_t>(commands_.size() - 1));
}

ProgrammableTransaction TransactionBuilder::finish() {
    ensure_open();
    finished_ = true;
    return ProgrammableTransaction{inputs_, commands_};
}

/* BuilderCheckpoint */

BuilderCheckpoint::BuilderCheckpoint(TransactionBuilder& tx)
    : tx_(tx),
      inputs_((tx.ensure_open(), tx.inputs_)),
      object_index_(tx.object_index_),
      command_count_(tx.commands_.size()) {}

BuilderCheckpoint::~BuilderCheckpoint() {
    if (committed_) return;
    tx_.inputs_.swap(inputs_);
    tx_.object_index_.swap(object_index_);
    tx_.commands_.erase(tx_.commands_.begin() + static_cast<std::ptrdiff_t>(command_count_),
                        tx_.commands_.end());
}

/* Wire encoding */

namespace bcs {

void to_bcs(Writer& w, const ObjectRef& ref) {
    to_bcs(w, ref.object_id);
    to_bcs(w, ref.version);
    // Digest is a length-prefixed byte vector
    w.write_uleb128(ref.digest.size());
    w.write_bytes(ref.digest.data(), ref.digest.size());
}

void to_bcs(Writer& w, const ObjectArg& arg) {
    w.write_uleb128(arg.index());
    if (const auto* owned = std::get_if<ImmOrOwnedObject>(&arg)) {
        to_bcs(w, owned->ref);
    } else {
        const auto& shared = std::get<SharedObject>(arg);
        to_bcs(w, shared.object_id);
        to_bcs(w, shared.initial_shared_version);
        to_bcs(w, shared.is_mutable);
    }
}

void to_bcs(Writer& w, const CallArg& arg) {
    w.write_uleb128(arg.index());
    if (const auto* pure = std::get_if<PureArg>(&arg)) {
        to_bcs(w, pure->bytes);
    } else {
        to_bcs(w, std::get<ObjectArg>(arg));
    }
}

void to_bcs(Writer& w, const Argument& arg) {
    w.write_uleb128(static_cast<uint8_t>(arg.kind));
    switch (arg.kind) {
        case Argument::Kind::GasCoin:
            break;
        case Argument::Kind::Input:
        case Argument::Kind::Result:
            to_bcs(w, arg.index);
            break;
        case Argument::Kind::NestedResult:
            to_bcs(w, arg.index);
            to_bcs(w, arg.nested);
            break;
    }
}

void to_bcs(Writer& w, const Command& cmd) {
    w.write_uleb128(cmd.index());
    std::visit(
        [&w](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, MoveCall>) {
                to_bcs(w, c.package);
                to_bcs(w, c.module);
                to_bcs(w, c.function);
                to_bcs(w, c.type_arguments);
                to_bcs(w, c.arguments);
            } else if constexpr (std::is_same_v<T, TransferObjects>) {
                to_bcs(w, c.objects);
                to_bcs(w, c.recipient);
            } else if constexpr (std::is_same_v<T, SplitCoins>) {
                to_bcs(w, c.coin);
                to_bcs(w, c.amounts);
            } else {
                to_bcs(w, c.destination);
                to_bcs(w, c.sources);
            }
        },
        cmd);
}

void to_bcs(Writer& w, const ProgrammableTransaction& tx) {
    // TransactionKind::ProgrammableTransaction
    w.write_uleb128(0);
    to_bcs(w, tx.inputs);
    to_bcs(w, tx.commands);
}

}  // namespace bcs

}  // namespace deepbook
