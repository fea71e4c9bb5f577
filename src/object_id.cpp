// DeepBook SDK - Object Identifiers Implementation

#include <deepbook/object_id.hpp>
#include <deepbook/encoding.hpp>
#include <deepbook/errors.hpp>
#include <algorithm>

namespace deepbook {

ObjectId ObjectId::from_hex(std::string_view hex) {
    if (hex.size() < 3 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        throw ParseError("Invalid object id '" + std::string(hex) + "': missing 0x prefix");
    }

    std::string_view digits = hex.substr(2);
    if (digits.size() > LENGTH * 2) {
        throw ParseError("Invalid object id '" + std::string(hex) + "': longer than 32 bytes");
    }

    std::string padded(LENGTH * 2 - digits.size(), '0');
    padded.append(digits);

    auto decoded = encoding::from_hex(padded);
    if (!decoded) {
        throw ParseError("Invalid object id '" + std::string(hex) + "': not hexadecimal");
    }

    Bytes bytes{};
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return ObjectId(bytes);
}

std::string ObjectId::to_hex() const {
    return "0x" + encoding::to_hex(bytes_.data(), bytes_.size());
}

std::string short_hex(const ObjectId& id) {
    std::string full = encoding::to_hex(id.bytes().data(), ObjectId::LENGTH);
    auto first = full.find_first_not_of('0');
    if (first == std::string::npos) return "0x0";
    return "0x" + full.substr(first);
}

ObjectDigest digest_from_base58(std::string_view text) {
    auto decoded = encoding::decode_base58(text);
    if (!decoded || decoded->size() != 32) {
        throw ParseError("Invalid object digest '" + std::string(text) + "'");
    }
    ObjectDigest digest{};
    std::copy(decoded->begin(), decoded->end(), digest.begin());
    return digest;
}

std::string digest_to_base58(const ObjectDigest& digest) {
    return encoding::encode_base58(digest.data(), digest.size());
}

}  // namespace deepbook
