// DeepBook SDK - Text Encodings Implementation

#include <deepbook/encoding.hpp>
#include <array>

namespace deepbook::encoding {

namespace {

constexpr const char* HEX_DIGITS = "0123456789abcdef";

/** All alphanumeric characters except for "0", "I", "O", and "l" */
constexpr const char* BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr const char* BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::array<int8_t, 256> make_reverse_table(const char* alphabet, size_t size) {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < size; ++i) {
        table[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

}  // namespace

std::string to_hex(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out += HEX_DIGITS[data[i] >> 4];
        out += HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// Base58 algorithm follows Bitcoin's implementation
std::string encode_base58(const uint8_t* data, size_t size) {
    const uint8_t* pbegin = data;
    const uint8_t* pend = data + size;

    // Skip & count leading zeroes.
    size_t zeroes = 0;
    size_t length = 0;
    while (pbegin != pend && *pbegin == 0) {
        pbegin++;
        zeroes++;
    }

    // log(256) / log(58), rounded up.
    size_t b58_size = static_cast<size_t>(pend - pbegin) * 138 / 100 + 1;
    std::vector<uint8_t> b58(b58_size);
    while (pbegin != pend) {
        int carry = *pbegin;
        size_t i = 0;
        for (auto it = b58.rbegin(); (carry != 0 || i < length) && (it != b58.rend()); ++it, ++i) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = i;
        pbegin++;
    }

    auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58_size - length);
    while (it != b58.end() && *it == 0) it++;

    std::string str;
    str.reserve(zeroes + static_cast<size_t>(b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) str += BASE58_ALPHABET[*(it++)];
    return str;
}

std::optional<std::vector<uint8_t>> decode_base58(std::string_view text) {
    static const auto reverse = make_reverse_table(BASE58_ALPHABET, 58);

    size_t pos = 0;
    size_t zeroes = 0;
    size_t length = 0;
    while (pos < text.size() && text[pos] == '1') {
        zeroes++;
        pos++;
    }

    // log(58) / log(256), rounded up.
    size_t b256_size = (text.size() - pos) * 733 / 1000 + 1;
    std::vector<uint8_t> b256(b256_size);
    for (; pos < text.size(); ++pos) {
        int carry = reverse[static_cast<uint8_t>(text[pos])];
        if (carry < 0) return std::nullopt;

        size_t i = 0;
        for (auto it = b256.rbegin(); (carry != 0 || i < length) && (it != b256.rend()); ++it, ++i) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) return std::nullopt;
        length = i;
    }

    auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256_size - length);
    std::vector<uint8_t> out(zeroes, 0x00);
    out.insert(out.end(), it, b256.end());
    return out;
}

std::string encode_base64(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8) | bytes[i + 2];
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += BASE64_ALPHABET[n & 0x3F];
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t{bytes[i]} << 16;
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<std::vector<uint8_t>> decode_base64(std::string_view text) {
    static const auto reverse = make_reverse_table(BASE64_ALPHABET, 64);

    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        uint32_t n = 0;
        int padding = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=') {
                // Padding only in the last two positions of the final group
                if (i + 4 != text.size() || j < 2) return std::nullopt;
                padding++;
                n <<= 6;
                continue;
            }
            if (padding > 0) return std::nullopt;
            int v = reverse[static_cast<uint8_t>(c)];
            if (v < 0) return std::nullopt;
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

}  // namespace deepbook::encoding
