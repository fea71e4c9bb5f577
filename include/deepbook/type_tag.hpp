// DeepBook SDK - Move Type Tags
// Parsed type arguments such as "0x2::sui::SUI" for generic move calls

#pragma once

#include <deepbook/bcs.hpp>
#include <deepbook/object_id.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace deepbook {

struct StructTag;

class TypeTag {
public:
    // Variant order is the wire tag
    enum class Kind : uint8_t {
        Bool = 0,
        U8 = 1,
        U64 = 2,
        U128 = 3,
        Address = 4,
        Signer = 5,
        Vector = 6,
        Struct = 7,
        U16 = 8,
        U32 = 9,
        U256 = 10
    };

    TypeTag() = default;

    static TypeTag primitive(Kind kind);
    static TypeTag vector_of(TypeTag element);
    static TypeTag structure(StructTag tag);

    // Parses the canonical textual form; throws ParseError
    static TypeTag parse(std::string_view text);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const TypeTag& element() const;
    [[nodiscard]] const StructTag& struct_tag() const;

    // Canonical form with full-length addresses
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TypeTag& rhs) const;
    bool operator!=(const TypeTag& rhs) const { return !(*this == rhs); }

private:
    Kind kind_ = Kind::Bool;
    std::shared_ptr<const TypeTag> element_;
    std::shared_ptr<const StructTag> struct_;
};

struct StructTag {
    ObjectId address;
    std::string module;
    std::string name;
    std::vector<TypeTag> type_params;

    // Parses "0xADDR::module::Name<...>"; throws ParseError
    static StructTag parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const StructTag& rhs) const {
        return address == rhs.address && module == rhs.module &&
               name == rhs.name && type_params == rhs.type_params;
    }
};

namespace bcs {

void to_bcs(Writer& w, const TypeTag& tag);
void to_bcs(Writer& w, const StructTag& tag);

}  // namespace bcs

}  // namespace deepbook
