// DeepBook SDK - Binary Canonical Serialization
// Little-endian fixed-width integers, ULEB128 lengths, no field tags

#pragma once

#include <deepbook/errors.hpp>
#include <deepbook/object_id.hpp>
#include <deepbook/types.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deepbook::bcs {

// Longest sequence a decoder will allocate for
inline constexpr uint64_t MAX_SEQUENCE_LENGTH = 10 * 1024 * 1024;

class Writer {
public:
    void write_byte(uint8_t b) { buffer_.push_back(b); }

    void write_bytes(const uint8_t* data, size_t size) {
        buffer_.insert(buffer_.end(), data, data + size);
    }

    void write_uleb128(uint64_t value) {
        while (value >= 0x80) {
            buffer_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        buffer_.push_back(static_cast<uint8_t>(value));
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }
    std::vector<uint8_t> take() noexcept { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

class Reader {
public:
    Reader(const uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}
    explicit Reader(const std::vector<uint8_t>& bytes) noexcept
        : data_(bytes.data()), size_(bytes.size()) {}

    uint8_t read_byte() {
        require(1);
        return data_[pos_++];
    }

    void read_bytes(uint8_t* out, size_t count) {
        require(count);
        std::copy(data_ + pos_, data_ + pos_ + count, out);
        pos_ += count;
    }

    uint64_t read_uleb128() {
        uint64_t value = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            uint8_t byte = read_byte();
            uint64_t digit = byte & 0x7F;
            if (shift == 63 && digit > 1) {
                throw DecodeError("ULEB128 value overflows 64 bits");
            }
            value |= digit << shift;
            if ((byte & 0x80) == 0) {
                // Canonical form forbids trailing zero groups
                if (byte == 0 && shift > 0) {
                    throw DecodeError("Non-canonical ULEB128 encoding");
                }
                return value;
            }
        }
        throw DecodeError("ULEB128 value overflows 64 bits");
    }

    uint64_t read_length() {
        uint64_t len = read_uleb128();
        if (len > MAX_SEQUENCE_LENGTH) {
            throw DecodeError("Sequence length " + std::to_string(len) + " exceeds limit");
        }
        return len;
    }

    [[nodiscard]] size_t remaining() const noexcept { return size_ - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ == size_; }

private:
    void require(size_t count) const {
        if (size_ - pos_ < count) {
            throw DecodeError("Unexpected end of input: need " + std::to_string(count) +
                              " bytes, " + std::to_string(size_ - pos_) + " left");
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

namespace detail {

template <typename Int>
inline void write_le(Writer& w, Int value) {
    for (size_t i = 0; i < sizeof(Int); ++i) {
        w.write_byte(static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }
}

template <typename Int>
inline Int read_le(Reader& r) {
    Int value = 0;
    for (size_t i = 0; i < sizeof(Int); ++i) {
        value |= static_cast<Int>(r.read_byte()) << (8 * i);
    }
    return value;
}

}  // namespace detail

// Set of unique values, serialized as a plain vector
template <typename T>
struct VecSet {
    std::vector<T> contents;
};

/* Primitives */

inline void to_bcs(Writer& w, bool b) { w.write_byte(b ? 1 : 0); }
inline void to_bcs(Writer& w, uint8_t v) { w.write_byte(v); }
inline void to_bcs(Writer& w, uint16_t v) { detail::write_le(w, v); }
inline void to_bcs(Writer& w, uint32_t v) { detail::write_le(w, v); }
inline void to_bcs(Writer& w, uint64_t v) { detail::write_le(w, v); }
inline void to_bcs(Writer& w, U128 v) { detail::write_le(w, v); }

inline void to_bcs(Writer& w, const std::string& s) {
    w.write_uleb128(s.size());
    for (char c : s) w.write_byte(static_cast<uint8_t>(c));
}

// Addresses are fixed-length, no length prefix
inline void to_bcs(Writer& w, const ObjectId& id) {
    w.write_bytes(id.bytes().data(), ObjectId::LENGTH);
}

inline void from_bcs(Reader& r, bool& b) {
    uint8_t v = r.read_byte();
    if (v > 1) {
        throw DecodeError("Bool value must be 0 or 1, found " + std::to_string(v));
    }
    b = v == 1;
}

inline void from_bcs(Reader& r, uint8_t& v) { v = r.read_byte(); }
inline void from_bcs(Reader& r, uint16_t& v) { v = detail::read_le<uint16_t>(r); }
inline void from_bcs(Reader& r, uint32_t& v) { v = detail::read_le<uint32_t>(r); }
inline void from_bcs(Reader& r, uint64_t& v) { v = detail::read_le<uint64_t>(r); }
inline void from_bcs(Reader& r, U128& v) { v = detail::read_le<U128>(r); }

inline void from_bcs(Reader& r, std::string& s) {
    uint64_t len = r.read_length();
    s.clear();
    for (uint64_t i = 0; i < len; ++i) s.push_back(static_cast<char>(r.read_byte()));
}

inline void from_bcs(Reader& r, ObjectId& id) {
    ObjectId::Bytes bytes{};
    r.read_bytes(bytes.data(), bytes.size());
    id = ObjectId(bytes);
}

/* Containers */

template <typename T>
void to_bcs(Writer& w, const std::vector<T>& items) {
    w.write_uleb128(items.size());
    for (const auto& item : items) to_bcs(w, item);
}

template <typename T>
void to_bcs(Writer& w, const std::optional<T>& value) {
    w.write_byte(value ? 1 : 0);
    if (value) to_bcs(w, *value);
}

template <typename T>
void to_bcs(Writer& w, const VecSet<T>& set) {
    to_bcs(w, set.contents);
}

template <typename T>
void from_bcs(Reader& r, std::vector<T>& items) {
    uint64_t len = r.read_length();
    items.clear();
    items.reserve(std::min<uint64_t>(len, r.remaining()));
    for (uint64_t i = 0; i < len; ++i) {
        T item{};
        from_bcs(r, item);
        items.push_back(std::move(item));
    }
}

template <typename T>
void from_bcs(Reader& r, std::optional<T>& value) {
    uint8_t tag = r.read_byte();
    if (tag == 0) {
        value.reset();
    } else if (tag == 1) {
        T inner{};
        from_bcs(r, inner);
        value = std::move(inner);
    } else {
        throw DecodeError("Invalid option tag " + std::to_string(tag));
    }
}

template <typename T>
void from_bcs(Reader& r, VecSet<T>& set) {
    from_bcs(r, set.contents);
}

/* Entry points */

template <typename T>
std::vector<uint8_t> to_bytes(const T& value) {
    Writer w;
    to_bcs(w, value);
    return w.take();
}

// Decodes exactly one T; trailing bytes are an error
template <typename T>
T from_bytes(const std::vector<uint8_t>& bytes) {
    Reader r(bytes);
    T value{};
    from_bcs(r, value);
    if (!r.at_end()) {
        throw DecodeError(std::to_string(r.remaining()) + " trailing bytes after value");
    }
    return value;
}

}  // namespace deepbook::bcs
