// DeepBook SDK - In-Memory Ledger for Tests

#pragma once

#include <deepbook/errors.hpp>
#include <deepbook/ledger.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace deepbook::testing {

class MockLedger : public LedgerClient {
public:
    void add_shared(std::string_view address, uint64_t initial_shared_version) {
        ObjectInfo info;
        info.object_id = ObjectId::from_hex(address);
        info.version = initial_shared_version + 100;
        info.ownership = OwnershipKind::Shared;
        info.initial_shared_version = initial_shared_version;
        put(info);
    }

    void add_owned(std::string_view address, uint64_t version, uint8_t digest_byte,
                   std::string_view owner = "0xa11ce") {
        ObjectInfo info;
        info.object_id = ObjectId::from_hex(address);
        info.version = version;
        info.digest.fill(digest_byte);
        info.ownership = OwnershipKind::AddressOwner;
        info.owner = SuiAddress::from_hex(owner);
        put(info);
    }

    void add_object_owned(std::string_view address, uint64_t version, std::string_view parent) {
        ObjectInfo info;
        info.object_id = ObjectId::from_hex(address);
        info.version = version;
        info.ownership = OwnershipKind::ObjectOwner;
        info.owner = ObjectId::from_hex(parent);
        put(info);
    }

    void add_immutable(std::string_view address, uint64_t version) {
        ObjectInfo info;
        info.object_id = ObjectId::from_hex(address);
        info.version = version;
        info.ownership = OwnershipKind::Immutable;
        put(info);
    }

    void put(const ObjectInfo& info) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[info.object_id] = info;
    }

    void remove(std::string_view address) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_.erase(ObjectId::from_hex(address));
    }

    // Pages are served by index; page i links to "i+1" when has_next_page is set
    void set_coin_pages(std::vector<CoinPage> pages) {
        std::lock_guard<std::mutex> lock(mutex_);
        coin_pages_ = std::move(pages);
    }

    void set_dev_inspect_result(DevInspectResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        dev_inspect_result_ = std::move(result);
    }

    void fail_dev_inspect(bool fail) { fail_dev_inspect_ = fail; }

    std::future<ObjectInfo> get_object(const ObjectId& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++object_fetches_;
        std::promise<ObjectInfo> promise;
        auto it = objects_.find(id);
        if (it == objects_.end()) {
            promise.set_exception(std::make_exception_ptr(
                FetchError("Object " + id.to_hex() + " does not exist")));
        } else {
            promise.set_value(it->second);
        }
        return promise.get_future();
    }

    std::future<CoinPage> get_coins(const SuiAddress& owner, const std::string& coin_type,
                                    const std::optional<std::string>& cursor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++coin_fetches_;
        last_coin_owner_ = owner;
        last_coin_type_ = coin_type;
        std::promise<CoinPage> promise;
        size_t index = cursor ? std::stoul(*cursor) : 0;
        if (index < coin_pages_.size()) {
            promise.set_value(coin_pages_[index]);
        } else {
            promise.set_value(CoinPage{});
        }
        return promise.get_future();
    }

    std::future<DevInspectResult> dev_inspect(const SuiAddress& sender,
                                              const ProgrammableTransaction& tx) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++dev_inspects_;
        last_sender_ = sender;
        last_transaction_ = tx;
        std::promise<DevInspectResult> promise;
        if (fail_dev_inspect_) {
            promise.set_exception(std::make_exception_ptr(FetchError("connection refused")));
        } else {
            promise.set_value(dev_inspect_result_);
        }
        return promise.get_future();
    }

    int object_fetches() const { return object_fetches_; }
    int coin_fetches() const { return coin_fetches_; }
    int dev_inspects() const { return dev_inspects_; }

    SuiAddress last_sender() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_sender_;
    }

    ProgrammableTransaction last_transaction() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_transaction_;
    }

    std::string last_coin_type() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_coin_type_;
    }

private:
    mutable std::mutex mutex_;
    std::map<ObjectId, ObjectInfo> objects_;
    std::vector<CoinPage> coin_pages_;
    DevInspectResult dev_inspect_result_;
    std::atomic<bool> fail_dev_inspect_{false};

    std::atomic<int> object_fetches_{0};
    std::atomic<int> coin_fetches_{0};
    std::atomic<int> dev_inspects_{0};

    SuiAddress last_sender_;
    ProgrammableTransaction last_transaction_;
    SuiAddress last_coin_owner_;
    std::string last_coin_type_;
};

// Single-value dry-run reply
inline DevInspectResult returning(std::vector<uint8_t> bytes, std::string type = "u64") {
    DevInspectResult result;
    result.results = std::vector<CommandResult>{
        CommandResult{{ReturnValue{std::move(bytes), std::move(type)}}}};
    return result;
}

}  // namespace deepbook::testing
