// DeepBook SDK - Move Type Tags Implementation

#include <deepbook/type_tag.hpp>
#include <deepbook/errors.hpp>
#include <cctype>
#include <utility>

namespace deepbook {

namespace {

struct Primitive {
    const char* name;
    TypeTag::Kind kind;
};

constexpr Primitive PRIMITIVES[] = {
    {"bool", TypeTag::Kind::Bool},
    {"u8", TypeTag::Kind::U8},
    {"u16", TypeTag::Kind::U16},
    {"u32", TypeTag::Kind::U32},
    {"u64", TypeTag::Kind::U64},
    {"u128", TypeTag::Kind::U128},
    {"u256", TypeTag::Kind::U256},
    {"address", TypeTag::Kind::Address},
    {"signer", TypeTag::Kind::Signer},
};

bool is_identifier(std::string_view s) noexcept {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

// Recursive-descent parser over the textual type syntax
class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    TypeTag parse_type() {
        skip_spaces();
        std::string_view word = peek_word();

        if (word == "vector") {
            pos_ += word.size();
            expect('<');
            TypeTag element = parse_type();
            expect('>');
            return TypeTag::vector_of(std::move(element));
        }
        for (const auto& p : PRIMITIVES) {
            if (word == p.name) {
                pos_ += word.size();
                return TypeTag::primitive(p.kind);
            }
        }
        return TypeTag::structure(parse_struct());
    }

    StructTag parse_struct() {
        skip_spaces();
        StructTag tag;
        tag.address = ObjectId::from_hex(take_until(':'));
        expect_path_separator();
        tag.module = take_identifier("module");
        expect_path_separator();
        tag.name = take_identifier("struct name");

        skip_spaces();
        if (pos_ < text_.size() && text_[pos_] == '<') {
            ++pos_;
            tag.type_params.push_back(parse_type());
            skip_spaces();
            while (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                tag.type_params.push_back(parse_type());
                skip_spaces();
            }
            expect('>');
        }
        return tag;
    }

    void finish() {
        skip_spaces();
        if (pos_ != text_.size()) fail("unexpected trailing input");
    }

private:
    [[noreturn]] void fail(const std::string& why) const {
        throw ParseError("Invalid type tag '" + std::string(text_) + "': " + why);
    }

    void skip_spaces() {
        while (pos_ < text_.size() && text_[pos_] == ' ') ++pos_;
    }

    void expect(char c) {
        skip_spaces();
        if (pos_ >= text_.size() || text_[pos_] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void expect_path_separator() {
        if (text_.substr(pos_, 2) != "::") fail("expected '::'");
        pos_ += 2;
    }

    std::string_view peek_word() const {
        size_t end = pos_;
        while (end < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[end])) || text_[end] == '_')) {
            ++end;
        }
        return text_.substr(pos_, end - pos_);
    }

    std::string_view take_until(char stop) {
        size_t end = text_.find(stop, pos_);
        if (end == std::string_view::npos) fail("expected '::'");
        std::string_view out = text_.substr(pos_, end - pos_);
        pos_ = end;
        return out;
    }

    std::string take_identifier(const char* what) {
        std::string_view word = peek_word();
        if (!is_identifier(word)) fail(std::string("invalid ") + what);
        pos_ += word.size();
        return std::string(word);
    }

    std::string_view text_;
    size_t pos_ = 0;
};

}  // namespace

TypeTag TypeTag::primitive(Kind kind) {
    if (kind == Kind::Vector || kind == Kind::Struct) {
        throw ParseError("Vector and struct type tags need an inner type");
    }
    TypeTag tag;
    tag.kind_ = kind;
    return tag;
}

TypeTag TypeTag::vector_of(TypeTag element) {
    TypeTag tag;
    tag.kind_ = Kind::Vector;
    tag.element_ = std::make_shared<const TypeTag>(std::move(element));
    return tag;
}

TypeTag TypeTag::structure(StructTag st) {
    TypeTag tag;
    tag.kind_ = Kind::Struct;
    tag.struct_ = std::make_shared<const StructTag>(std::move(st));
    return tag;
}

TypeTag TypeTag::parse(std::string_view text) {
    Parser parser(text);
    TypeTag tag = parser.parse_type();
    parser.finish();
    return tag;
}

const TypeTag& TypeTag::element() const {
    if (kind_ != Kind::Vector) throw std::logic_error("TypeTag is not a vector");
    return *element_;
}

const StructTag& TypeTag::struct_tag() const {
    if (kind_ != Kind::Struct) throw std::logic_error("TypeTag is not a struct");
    return *struct_;
}

std::string TypeTag::to_string() const {
    switch (kind_) {
        case Kind::Vector: return "vector<" + element_->to_string() + ">";
        case Kind::Struct: return struct_->to_string();
        default: break;
    }
    for (const auto& p : PRIMITIVES) {
        if (p.kind == kind_) return p.name;
    }
    return "unknown";
}

bool TypeTag::operator==(const TypeTag& rhs) const {
    if (kind_ != rhs.kind_) return false;
    switch (kind_) {
        case Kind::Vector: return *element_ == *rhs.element_;
        case Kind::Struct: return *struct_ == *rhs.struct_;
        default: return true;
    }
}

StructTag StructTag::parse(std::string_view text) {
    Parser parser(text);
    StructTag tag = parser.parse_struct();
    parser.finish();
    return tag;
}

std::string StructTag::to_string() const {
    std::string out = address.to_hex() + "::" + module + "::" + name;
    if (!type_params.empty()) {
        out += '<';
        for (size_t i = 0; i < type_params.size(); ++i) {
            if (i > 0) out += ", ";
            out += type_params[i].to_string();
        }
        out += '>';
    }
    return out;
}

namespace bcs {

void to_bcs(Writer& w, const TypeTag& tag) {
    w.write_byte(static_cast<uint8_t>(tag.kind()));
    switch (tag.kind()) {
        case TypeTag::Kind::Vector:
            to_bcs(w, tag.element());
            break;
        case TypeTag::Kind::Struct:
            to_bcs(w, tag.struct_tag());
            break;
        default:
            break;
    }
}

void to_bcs(Writer& w, const StructTag& tag) {
    to_bcs(w, tag.address);
    to_bcs(w, tag.module);
    to_bcs(w, tag.name);
    to_bcs(w, tag.type_params);
}

}  // namespace bcs

}  // namespace deepbook
