// DeepBook SDK - JSON-RPC Ledger Client
// LedgerClient over a fullnode's HTTP JSON-RPC endpoint

#pragma once

#include <deepbook/ledger.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>
#include <string_view>

namespace deepbook {

class JsonRpcClient : public LedgerClient {
public:
    explicit JsonRpcClient(std::string_view url, int timeout_ms = 30000);

    std::future<ObjectInfo> get_object(const ObjectId& id) override;

    std::future<CoinPage> get_coins(const SuiAddress& owner,
                                    const std::string& coin_type,
                                    const std::optional<std::string>& cursor) override;

    std::future<DevInspectResult> dev_inspect(const SuiAddress& sender,
                                              const ProgrammableTransaction& tx) override;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    // Sends one request and returns its "result"; throws FetchError
    nlohmann::json call(const std::string& method, nlohmann::json params);

private:
    std::string url_;
    int timeout_ms_;
    std::atomic<uint64_t> next_id_{1};
};

// Response decoding, separate from transport
namespace rpc {

ObjectInfo parse_object_response(const nlohmann::json& result);
CoinPage parse_coin_page(const nlohmann::json& result);
DevInspectResult parse_dev_inspect_response(const nlohmann::json& result);

}  // namespace rpc

}  // namespace deepbook
