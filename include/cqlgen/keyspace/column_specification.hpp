// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Column Specifications                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/cql/identifier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace cqlgen::keyspace {

enum class KeyRole : std::uint8_t {
    None,
    Partition,
    Cluster,
};

enum class Ordering : std::uint8_t {
    Asc,
    Desc,
};

[[nodiscard]] constexpr const char* ordering_to_string(Ordering ordering) noexcept {
    return ordering == Ordering::Asc ? "ASC" : "DESC";
}

// ==============================================================================
// Column / field definition
// ==============================================================================

/// Column of a table: name, type, key role and, for clustering columns,
/// an optional explicit sort order
class ColumnSpecification {
public:
    /// Throws SpecificationError(InvalidArgument) if an ordering is given
    /// for a column that is not a clustering column.
    ColumnSpecification(cql::Identifier name, cql::DataType type,
                        KeyRole role = KeyRole::None,
                        std::optional<Ordering> ordering = std::nullopt);

    [[nodiscard]] const cql::Identifier& name() const noexcept { return name_; }
    [[nodiscard]] const cql::DataType& type() const noexcept { return type_; }
    [[nodiscard]] KeyRole key_role() const noexcept { return role_; }
    [[nodiscard]] const std::optional<Ordering>& ordering() const noexcept { return ordering_; }

    [[nodiscard]] bool is_partition_key() const noexcept { return role_ == KeyRole::Partition; }
    [[nodiscard]] bool is_cluster_key() const noexcept { return role_ == KeyRole::Cluster; }

    /// `name type`
    [[nodiscard]] std::string to_cql() const;

    bool operator==(const ColumnSpecification& other) const {
        return name_ == other.name_ && type_ == other.type_ &&
               role_ == other.role_ && ordering_ == other.ordering_;
    }

private:
    cql::Identifier name_;
    cql::DataType type_;
    KeyRole role_;
    std::optional<Ordering> ordering_;
};

// ==============================================================================
// Column changes (ALTER TABLE / ALTER TYPE)
// ==============================================================================

struct AddColumn {
    cql::Identifier name;
    cql::DataType type;

    bool operator==(const AddColumn& other) const { return name == other.name && type == other.type; }
};

struct DropColumn {
    cql::Identifier name;

    bool operator==(const DropColumn& other) const { return name == other.name; }
};

struct AlterColumn {
    cql::Identifier name;
    cql::DataType type;

    bool operator==(const AlterColumn& other) const { return name == other.name && type == other.type; }
};

struct RenameColumn {
    cql::Identifier from;
    cql::Identifier to;

    bool operator==(const RenameColumn& other) const { return from == other.from && to == other.to; }
};

/// One change of an alter statement, applied in declaration order
using ColumnChange = std::variant<AddColumn, DropColumn, AlterColumn, RenameColumn>;

/// `ADD c t`, `DROP c`, `ALTER c TYPE t` or `RENAME a TO b`
[[nodiscard]] std::string to_cql(const ColumnChange& change);

} // namespace cqlgen::keyspace
