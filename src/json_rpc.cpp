// DeepBook SDK - JSON-RPC Ledger Client Implementation

#include <deepbook/json_rpc.hpp>
#include <deepbook/encoding.hpp>
#include <deepbook/errors.hpp>
#include <deepbook/log.hpp>
#include <deepbook/types.hpp>
#include <cpr/cpr.h>

namespace deepbook {

using json = nlohmann::json;

namespace rpc {

namespace {

// Fullnodes send u64 fields as strings, older ones as numbers
uint64_t get_u64(const json& j, const char* field) {
    if (!j.contains(field)) {
        throw FetchError(std::string("Response missing field '") + field + "'");
    }
    const auto& v = j.at(field);
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_string()) return parse_u64(v.get<std::string>(), field);
    throw FetchError(std::string("Field '") + field + "' is not an unsigned integer");
}

std::string get_string(const json& j, const char* field) {
    if (!j.contains(field) || !j.at(field).is_string()) {
        throw FetchError(std::string("Response missing string field '") + field + "'");
    }
    return j.at(field).get<std::string>();
}

void parse_owner(const json& owner, ObjectInfo& info) {
    if (owner.is_string()) {
        if (owner.get<std::string>() == "Immutable") {
            info.ownership = OwnershipKind::Immutable;
            return;
        }
    } else if (owner.is_object()) {
        if (owner.contains("AddressOwner")) {
            info.ownership = OwnershipKind::AddressOwner;
            info.owner = SuiAddress::from_hex(get_string(owner, "AddressOwner"));
            return;
        }
        if (owner.contains("ObjectOwner")) {
            info.ownership = OwnershipKind::ObjectOwner;
            info.owner = SuiAddress::from_hex(get_string(owner, "ObjectOwner"));
            return;
        }
        if (owner.contains("Shared")) {
            info.ownership = OwnershipKind::Shared;
            info.initial_shared_version = get_u64(owner.at("Shared"), "initial_shared_version");
            return;
        }
    }
    throw FetchError("Unrecognized object owner: " + owner.dump());
}

std::vector<uint8_t> get_byte_array(const json& j) {
    if (!j.is_array()) throw FetchError("Return value bytes are not an array");
    std::vector<uint8_t> bytes;
    bytes.reserve(j.size());
    for (const auto& b : j) {
        if (!b.is_number_unsigned() || b.get<uint64_t>() > 0xFF) {
            throw FetchError("Return value byte out of range: " + b.dump());
        }
        bytes.push_back(static_cast<uint8_t>(b.get<uint64_t>()));
    }
    return bytes;
}

}  // namespace

ObjectInfo parse_object_response(const json& result) {
    if (result.contains("error") && !result.at("error").is_null()) {
        throw FetchError("Object unavailable: " + result.at("error").dump());
    }
    if (!result.contains("data") || !result.at("data").is_object()) {
        throw FetchError("Object response carries no data");
    }

    const auto& data = result.at("data");
    ObjectInfo info;
    info.object_id = ObjectId::from_hex(get_string(data, "objectId"));
    info.version = get_u64(data, "version");
    info.digest = digest_from_base58(get_string(data, "digest"));
    if (data.contains("type") && data.at("type").is_string()) {
        info.type = data.at("type").get<std::string>();
    }
    if (!data.contains("owner")) {
        throw FetchError("Object " + info.object_id.to_hex() + " response carries no owner");
    }
    parse_owner(data.at("owner"), info);
    return info;
}

CoinPage parse_coin_page(const json& result) {
    CoinPage page;
    for (const auto& c : result.at("data")) {
        CoinInfo coin;
        coin.coin_type = get_string(c, "coinType");
        coin.ref.object_id = ObjectId::from_hex(get_string(c, "coinObjectId"));
        coin.ref.version = get_u64(c, "version");
        coin.ref.digest = digest_from_base58(get_string(c, "digest"));
        coin.balance = get_u64(c, "balance");
        page.data.push_back(std::move(coin));
    }
    if (result.contains("nextCursor") && result.at("nextCursor").is_string()) {
        page.next_cursor = result.at("nextCursor").get<std::string>();
    }
    page.has_next_page = result.value("hasNextPage", false);
    return page;
}

DevInspectResult parse_dev_inspect_response(const json& result) {
    DevInspectResult out;

    if (result.contains("error") && result.at("error").is_string()) {
        out.error = result.at("error").get<std::string>();
    } else if (result.contains("effects")) {
        const auto& status = result.at("effects").value("status", json::object());
        if (status.value("status", "success") != "success") {
            out.error = status.value("error", "unknown failure");
        }
    }

    if (result.contains("results") && result.at("results").is_array()) {
        out.results.emplace();
        for (const auto& r : result.at("results")) {
            CommandResult cmd;
            if (r.contains("returnValues")) {
                for (const auto& rv : r.at("returnValues")) {
                    // [bytes, type]
                    if (!rv.is_array() || rv.size() != 2) {
                        throw FetchError("Malformed return value: " + rv.dump());
                    }
                    cmd.return_values.push_back(
                        ReturnValue{get_byte_array(rv.at(0)), rv.at(1).get<std::string>()});
                }
            }
            out.results->push_back(std::move(cmd));
        }
    }
    return out;
}

}  // namespace rpc

JsonRpcClient::JsonRpcClient(std::string_view url, int timeout_ms)
    : url_(url), timeout_ms_(timeout_ms) {}

json JsonRpcClient::call(const std::string& method, json params) {
    json body = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1, std::memory_order_relaxed)},
        {"method", method},
        {"params", std::move(params)},
    };

    log::logger()->debug("rpc {} -> {}", method, url_);

    auto response = cpr::Post(
        cpr::Url{url_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw FetchError(method + ": " + response.error.message);
    }
    if (response.status_code != 200) {
        throw FetchError(method + ": HTTP " + std::to_string(response.status_code) +
                         ": " + response.text);
    }

    json reply;
    try {
        reply = json::parse(response.text);
    } catch (const json::exception&) {
        std::throw_with_nested(FetchError(method + ": response is not JSON"));
    }

    if (reply.contains("error") && !reply.at("error").is_null()) {
        const auto& err = reply.at("error");
        throw FetchError(method + ": RPC error " + std::to_string(err.value("code", 0)) +
                         ": " + err.value("message", std::string("unknown")));
    }
    if (!reply.contains("result")) {
        throw FetchError(method + ": response carries no result");
    }
    return reply.at("result");
}

std::future<ObjectInfo> JsonRpcClient::get_object(const ObjectId& id) {
    return std::async(std::launch::async, [this, id]() {
        json params = json::array({id.to_hex(), {{"showOwner", true}, {"showType", true}}});
        json result = call("sui_getObject", std::move(params));
        try {
            return rpc::parse_object_response(result);
        } catch (const FetchError&) {
            throw;
        } catch (const std::exception&) {
            std::throw_with_nested(FetchError("Malformed object response for " + id.to_hex()));
        }
    });
}

std::future<CoinPage> JsonRpcClient::get_coins(const SuiAddress& owner,
                                               const std::string& coin_type,
                                               const std::optional<std::string>& cursor) {
    return std::async(std::launch::async, [this, owner, coin_type, cursor]() {
        json params = json::array({owner.to_hex(), coin_type,
                                   cursor ? json(*cursor) : json(nullptr), nullptr});
        json result = call("suix_getCoins", std::move(params));
        try {
            return rpc::parse_coin_page(result);
        } catch (const FetchError&) {
            throw;
        } catch (const std::exception&) {
            std::throw_with_nested(FetchError("Malformed coin page for " + coin_type));
        }
    });
}

std::future<DevInspectResult> JsonRpcClient::dev_inspect(const SuiAddress& sender,
                                                         const ProgrammableTransaction& tx) {
    std::string tx_bytes = encoding::encode_base64(tx.transaction_kind_bytes());
    return std::async(std::launch::async, [this, sender, tx_bytes = std::move(tx_bytes)]() {
        json params = json::array({sender.to_hex(), tx_bytes, nullptr, nullptr});
        json result = call("sui_devInspectTransactionBlock", std::move(params));
        try {
            return rpc::parse_dev_inspect_response(result);
        } catch (const FetchError&) {
            throw;
        } catch (const std::exception&) {
            std::throw_with_nested(FetchError("Malformed dry-run response"));
        }
    });
}

}  // namespace deepbook
