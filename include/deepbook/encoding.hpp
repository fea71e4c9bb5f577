// DeepBook SDK - Text Encodings
// Hex, Base58 (object digests) and Base64 (transaction bytes)

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deepbook::encoding {

std::string to_hex(const uint8_t* data, size_t size);

inline std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

// Even-length hex without prefix; std::nullopt on any non-hex character
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Base58 with the Bitcoin alphabet
std::string encode_base58(const uint8_t* data, size_t size);
std::optional<std::vector<uint8_t>> decode_base58(std::string_view text);

std::string encode_base64(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> decode_base64(std::string_view text);

}  // namespace deepbook::encoding
