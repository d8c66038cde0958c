// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Data Types Implementation                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/types.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/core.h>

#include <array>
#include <cctype>
#include <utility>

namespace cqlgen::cql {

namespace {

// Counts every type in the chain, so list<int> is two levels
constexpr std::size_t kMaxNestingDepth = 64;

constexpr std::array<NativeType, 21> kNativeTypes = {
    NativeType::Ascii, NativeType::Bigint, NativeType::Blob, NativeType::Boolean,
    NativeType::Counter, NativeType::Date, NativeType::Decimal, NativeType::Double,
    NativeType::Duration, NativeType::Float, NativeType::Inet, NativeType::Int,
    NativeType::Smallint, NativeType::Text, NativeType::Time, NativeType::Timestamp,
    NativeType::Timeuuid, NativeType::Tinyint, NativeType::Uuid, NativeType::Varchar,
    NativeType::Varint,
};

std::string to_lower(std::string_view text) {
    return boost::to_lower_copy(std::string(text));
}

std::optional<NativeType> native_from_name(std::string_view name) {
    const auto lower = to_lower(name);
    for (auto type : kNativeTypes) {
        if (lower == native_type_to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

// ==============================================================================
// Type expression parser
// ==============================================================================

/// Recursive descent over `name [ '<' type (',' type)* '>' ]`
class TypeParser {
public:
    explicit TypeParser(std::string_view text) : text_(text) {}

    DataType parse() {
        DataType type = parse_type();
        skip_whitespace();
        if (!is_at_end()) {
            throw error("unexpected trailing input");
        }
        return type;
    }

private:
    DataType parse_type() {
        if (depth_ == kMaxNestingDepth) {
            throw error(fmt::format("type nesting exceeds {} levels", kMaxNestingDepth));
        }
        ++depth_;
        DataType type = parse_single_type();
        --depth_;
        return type;
    }

    DataType parse_single_type() {
        const std::string name = consume_name();
        const std::string lower = to_lower(name);

        if (lower == "frozen") {
            consume('<', "expected '<' after frozen");
            DataType inner = parse_type();
            consume('>', "expected '>' to close frozen");
            return inner.frozen();
        }
        if (lower == "list" || lower == "set") {
            consume('<', "expected '<' after collection type");
            DataType element = parse_type();
            consume('>', "expected '>' to close collection type");
            return lower == "list" ? DataType::list_of(std::move(element))
                                   : DataType::set_of(std::move(element));
        }
        if (lower == "map") {
            consume('<', "expected '<' after map");
            DataType key = parse_type();
            consume(',', "expected ',' between map key and value types");
            DataType value = parse_type();
            consume('>', "expected '>' to close map");
            return DataType::map_of(std::move(key), std::move(value));
        }
        if (lower == "tuple") {
            consume('<', "expected '<' after tuple");
            std::vector<DataType> elements;
            do {
                elements.push_back(parse_type());
            } while (match(','));
            consume('>', "expected '>' to close tuple");
            return DataType::tuple_of(std::move(elements));
        }

        if (auto native = native_from_name(name); native && name.front() != '"') {
            return DataType::native(*native);
        }

        try {
            return DataType::user_defined(Identifier::from_cql(name));
        } catch (const InvalidIdentifierError&) {
            throw error(fmt::format("invalid type name '{}'", name));
        }
    }

    std::string consume_name() {
        skip_whitespace();
        if (is_at_end()) {
            throw error("expected type name");
        }

        const std::size_t start = pos_;
        if (peek() == '"') {
            ++pos_;
            while (!is_at_end()) {
                if (peek() == '"') {
                    if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '"') {
                        pos_ += 2;
                        continue;
                    }
                    ++pos_;
                    return std::string(text_.substr(start, pos_ - start));
                }
                ++pos_;
            }
            throw error("unterminated quoted type name");
        }

        while (!is_at_end() &&
               (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
            ++pos_;
        }
        if (pos_ == start) {
            throw error(fmt::format("unexpected character '{}'", peek()));
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    bool match(char expected) {
        skip_whitespace();
        if (!is_at_end() && peek() == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    void consume(char expected, const char* message) {
        if (!match(expected)) {
            throw error(message);
        }
    }

    void skip_whitespace() {
        while (!is_at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
    }

    [[nodiscard]] char peek() const { return text_[pos_]; }
    [[nodiscard]] bool is_at_end() const { return pos_ >= text_.size(); }

    SpecificationError error(const std::string& message) const {
        return SpecificationError(ErrorCode::InvalidDataType,
            fmt::format("cannot parse data type [{}] at offset {}: {}", text_, pos_, message));
    }

    std::string_view text_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

} // anonymous namespace

// ==============================================================================
// Factories
// ==============================================================================

DataType DataType::native(NativeType type) {
    return DataType(Kind::Native, type);
}

DataType DataType::list_of(DataType element, bool frozen) {
    DataType type(Kind::List, NativeType::Text);
    type.arguments_.push_back(std::move(element));
    type.frozen_ = frozen;
    return type;
}

DataType DataType::set_of(DataType element, bool frozen) {
    DataType type(Kind::Set, NativeType::Text);
    type.arguments_.push_back(std::move(element));
    type.frozen_ = frozen;
    return type;
}

DataType DataType::map_of(DataType key, DataType value, bool frozen) {
    DataType type(Kind::Map, NativeType::Text);
    type.arguments_.push_back(std::move(key));
    type.arguments_.push_back(std::move(value));
    type.frozen_ = frozen;
    return type;
}

DataType DataType::tuple_of(std::vector<DataType> elements) {
    if (elements.empty()) {
        throw SpecificationError(ErrorCode::InvalidDataType, "tuple type needs at least one element");
    }
    DataType type(Kind::Tuple, NativeType::Text);
    type.arguments_ = std::move(elements);
    return type;
}

DataType DataType::user_defined(Identifier name, bool frozen) {
    DataType type(Kind::UserDefined, NativeType::Text);
    type.user_type_ = std::move(name);
    type.frozen_ = frozen;
    return type;
}

DataType DataType::parse(std::string_view text) {
    return TypeParser(text).parse();
}

// ==============================================================================
// Rendering
// ==============================================================================

DataType DataType::frozen() const {
    DataType copy = *this;
    if (kind_ != Kind::Native) {
        copy.frozen_ = true;
    }
    return copy;
}

std::string DataType::to_cql() const {
    std::string rendered;

    switch (kind_) {
        case Kind::Native:
            return native_type_to_string(native_);
        case Kind::UserDefined:
            rendered = user_type_->to_cql();
            break;
        case Kind::List:
        case Kind::Set:
        case Kind::Map:
        case Kind::Tuple: {
            rendered = kind_ == Kind::List ? "list<"
                     : kind_ == Kind::Set  ? "set<"
                     : kind_ == Kind::Map  ? "map<"
                                           : "tuple<";
            for (std::size_t i = 0; i < arguments_.size(); ++i) {
                if (i > 0) rendered += ", ";
                rendered += arguments_[i].to_cql();
            }
            rendered += '>';
            break;
        }
    }

    return frozen_ ? "frozen<" + rendered + ">" : rendered;
}

bool DataType::operator==(const DataType& other) const {
    if (kind_ != other.kind_ || frozen_ != other.frozen_) {
        return false;
    }
    if (kind_ == Kind::Native) {
        return native_ == other.native_;
    }
    return arguments_ == other.arguments_ && user_type_ == other.user_type_;
}

} // namespace cqlgen::cql
