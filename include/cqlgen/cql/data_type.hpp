// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Data Types                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/identifier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cqlgen::cql {

enum class NativeType : std::uint8_t {
    Ascii,
    Bigint,
    Blob,
    Boolean,
    Counter,
    Date,
    Decimal,
    Double,
    Duration,
    Float,
    Inet,
    Int,
    Smallint,
    Text,
    Time,
    Timestamp,
    Timeuuid,
    Tinyint,
    Uuid,
    Varchar,
    Varint,
};

[[nodiscard]] constexpr const char* native_type_to_string(NativeType type) noexcept {
    switch (type) {
        case NativeType::Ascii: return "ascii";
        case NativeType::Bigint: return "bigint";
        case NativeType::Blob: return "blob";
        case NativeType::Boolean: return "boolean";
        case NativeType::Counter: return "counter";
        case NativeType::Date: return "date";
        case NativeType::Decimal: return "decimal";
        case NativeType::Double: return "double";
        case NativeType::Duration: return "duration";
        case NativeType::Float: return "float";
        case NativeType::Inet: return "inet";
        case NativeType::Int: return "int";
        case NativeType::Smallint: return "smallint";
        case NativeType::Text: return "text";
        case NativeType::Time: return "time";
        case NativeType::Timestamp: return "timestamp";
        case NativeType::Timeuuid: return "timeuuid";
        case NativeType::Tinyint: return "tinyint";
        case NativeType::Uuid: return "uuid";
        case NativeType::Varchar: return "varchar";
        case NativeType::Varint: return "varint";
        default: return "unknown";
    }
}

/// CQL type expression: native, collection, tuple or user-defined
class DataType {
public:
    enum class Kind : std::uint8_t {
        Native,
        List,
        Set,
        Map,
        Tuple,
        UserDefined,
    };

    // ==========================================================================
    // Factories
    // ==========================================================================

    [[nodiscard]] static DataType native(NativeType type);

    [[nodiscard]] static DataType ascii() { return native(NativeType::Ascii); }
    [[nodiscard]] static DataType bigint() { return native(NativeType::Bigint); }
    [[nodiscard]] static DataType blob() { return native(NativeType::Blob); }
    [[nodiscard]] static DataType cboolean() { return native(NativeType::Boolean); }
    [[nodiscard]] static DataType cdouble() { return native(NativeType::Double); }
    [[nodiscard]] static DataType cfloat() { return native(NativeType::Float); }
    [[nodiscard]] static DataType cint() { return native(NativeType::Int); }
    [[nodiscard]] static DataType counter() { return native(NativeType::Counter); }
    [[nodiscard]] static DataType text() { return native(NativeType::Text); }
    [[nodiscard]] static DataType timestamp() { return native(NativeType::Timestamp); }
    [[nodiscard]] static DataType timeuuid() { return native(NativeType::Timeuuid); }
    [[nodiscard]] static DataType uuid() { return native(NativeType::Uuid); }
    [[nodiscard]] static DataType varchar() { return native(NativeType::Varchar); }

    [[nodiscard]] static DataType list_of(DataType element, bool frozen = false);
    [[nodiscard]] static DataType set_of(DataType element, bool frozen = false);
    [[nodiscard]] static DataType map_of(DataType key, DataType value, bool frozen = false);
    [[nodiscard]] static DataType tuple_of(std::vector<DataType> elements);
    [[nodiscard]] static DataType user_defined(Identifier name, bool frozen = false);

    /// Parse a type expression such as `map<text, frozen<list<int>>>`.
    /// Throws SpecificationError(InvalidDataType) on malformed input.
    [[nodiscard]] static DataType parse(std::string_view text);

    // ==========================================================================
    // Observers
    // ==========================================================================

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }
    [[nodiscard]] bool is_collection() const noexcept {
        return kind_ == Kind::List || kind_ == Kind::Set || kind_ == Kind::Map;
    }
    [[nodiscard]] const std::vector<DataType>& type_arguments() const noexcept { return arguments_; }

    /// Returns a frozen copy of this type
    [[nodiscard]] DataType frozen() const;

    [[nodiscard]] std::string to_cql() const;

    bool operator==(const DataType& other) const;
    bool operator!=(const DataType& other) const { return !(*this == other); }

private:
    DataType(Kind kind, NativeType native) : kind_(kind), native_(native) {}

    Kind kind_;
    NativeType native_;
    bool frozen_{false};
    std::vector<DataType> arguments_;
    std::optional<Identifier> user_type_;
};

} // namespace cqlgen::cql
