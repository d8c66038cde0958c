// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Identifier                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cqlgen::cql {

/// Returns true if `name` matches [A-Za-z_][A-Za-z0-9_]* and is not reserved.
[[nodiscard]] bool is_unquoted_identifier(std::string_view name) noexcept;

/// Returns true if `name` matches [A-Za-z_]([A-Za-z0-9_]|"")*
[[nodiscard]] bool is_quoted_identifier(std::string_view name) noexcept;

/// Case-insensitive lookup in the reserved CQL keyword set
[[nodiscard]] bool is_reserved_keyword(std::string_view name) noexcept;

/// Name of a keyspace, table, column, index or user type.
///
/// The source string given to the constructor is in CQL form: plain names
/// like `users` stay unquoted, names containing doubled quotes (`a""b`) or
/// reserved keywords (`select`) are quoted on render. A force-quoted
/// identifier takes the source string literally as its logical name.
class Identifier {
public:
    /// Throws InvalidIdentifierError if `name` matches neither grammar.
    explicit Identifier(std::string_view name, bool force_quote = false);

    /// Force-quoted identifier, e.g. to preserve case
    [[nodiscard]] static Identifier quoted(std::string_view name);

    /// Re-derive an identifier from its rendered form
    [[nodiscard]] static Identifier from_cql(std::string_view cql);

    /// Rendered form: `name` or `"name"` with internal quotes doubled
    [[nodiscard]] const std::string& to_cql() const noexcept { return rendered_; }

    /// Logical name without enclosing quotes
    [[nodiscard]] const std::string& unquoted() const noexcept { return unquoted_; }

    [[nodiscard]] bool is_quoted() const noexcept { return quoted_; }

    bool operator==(const Identifier& other) const noexcept {
        return quoted_ == other.quoted_ && rendered_ == other.rendered_;
    }
    bool operator!=(const Identifier& other) const noexcept { return !(*this == other); }

    /// Unquoted identifiers sort before quoted ones
    bool operator<(const Identifier& other) const noexcept {
        if (quoted_ != other.quoted_) return !quoted_;
        return rendered_ < other.rendered_;
    }

private:
    Identifier() = default;

    std::string unquoted_;
    std::string rendered_;
    bool quoted_{false};
};

/// Object name with an optional keyspace prefix, rendered `ks.name`
class QualifiedName {
public:
    explicit QualifiedName(Identifier name, std::optional<Identifier> keyspace = std::nullopt)
        : name_(std::move(name)), keyspace_(std::move(keyspace)) {}

    [[nodiscard]] const Identifier& name() const noexcept { return name_; }
    [[nodiscard]] const std::optional<Identifier>& keyspace() const noexcept { return keyspace_; }

    [[nodiscard]] std::string to_cql() const {
        return keyspace_ ? keyspace_->to_cql() + "." + name_.to_cql() : name_.to_cql();
    }

    bool operator==(const QualifiedName& other) const {
        return name_ == other.name_ && keyspace_ == other.keyspace_;
    }
    bool operator!=(const QualifiedName& other) const { return !(*this == other); }

private:
    Identifier name_;
    std::optional<Identifier> keyspace_;
};

} // namespace cqlgen::cql
