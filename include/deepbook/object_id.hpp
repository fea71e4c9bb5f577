// DeepBook SDK - Object Identifiers
// 32-byte ledger addresses for objects, packages and accounts

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>

namespace deepbook {

class ObjectId {
public:
    static constexpr size_t LENGTH = 32;
    using Bytes = std::array<uint8_t, LENGTH>;

    constexpr ObjectId() noexcept : bytes_{} {}
    constexpr explicit ObjectId(const Bytes& bytes) noexcept : bytes_(bytes) {}

    // Parses "0x" followed by 1-64 hex digits; short forms are left-padded with zeros.
    // Throws ParseError on malformed input.
    static ObjectId from_hex(std::string_view hex);

    // Full-length "0x" + 64 lowercase hex digits
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

    bool operator==(const ObjectId& rhs) const noexcept { return bytes_ == rhs.bytes_; }
    bool operator!=(const ObjectId& rhs) const noexcept { return bytes_ != rhs.bytes_; }
    bool operator<(const ObjectId& rhs) const noexcept { return bytes_ < rhs.bytes_; }

private:
    Bytes bytes_;
};

// Account addresses share the object id format
using SuiAddress = ObjectId;

// Digest of an object version, base58 on the JSON-RPC surface
using ObjectDigest = std::array<uint8_t, 32>;

ObjectDigest digest_from_base58(std::string_view text);
std::string digest_to_base58(const ObjectDigest& digest);

// Short-form address with leading zeros stripped ("0x2", "0x6")
std::string short_hex(const ObjectId& id);

}  // namespace deepbook

namespace std {

template <>
struct hash<deepbook::ObjectId> {
    size_t operator()(const deepbook::ObjectId& id) const noexcept {
        size_t h = 0;
        std::memcpy(&h, id.bytes().data() + deepbook::ObjectId::LENGTH - sizeof(h), sizeof(h));
        return h;
    }
};

}  // namespace std
