// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Index Specifications                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/identifier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cqlgen::keyspace {

/// Collection projection an index is built on
enum class ColumnFunction : std::uint8_t {
    None,
    Keys,
    Values,
    Entries,
    Full,
};

[[nodiscard]] constexpr const char* column_function_to_string(ColumnFunction function) noexcept {
    switch (function) {
        case ColumnFunction::None: return "";
        case ColumnFunction::Keys: return "KEYS";
        case ColumnFunction::Values: return "VALUES";
        case ColumnFunction::Entries: return "ENTRIES";
        case ColumnFunction::Full: return "FULL";
        default: return "";
    }
}

// ==============================================================================
// CREATE INDEX
// ==============================================================================

class CreateIndexSpecification {
public:
    using IndexOptions = std::vector<std::pair<std::string, std::string>>;

    class Builder {
    public:
        Builder() = default;

        /// Without a name the server derives one
        Builder& name(cql::Identifier name);
        Builder& name(std::string_view name) { return this->name(cql::Identifier(name)); }

        Builder& table(cql::QualifiedName table);
        Builder& table(std::string_view table) {
            return this->table(cql::QualifiedName(cql::Identifier(table)));
        }

        Builder& column(cql::Identifier column, ColumnFunction function = ColumnFunction::None);
        Builder& column(std::string_view column, ColumnFunction function = ColumnFunction::None) {
            return this->column(cql::Identifier(column), function);
        }

        Builder& if_not_exists(bool value = true) {
            if_not_exists_ = value;
            return *this;
        }

        /// Marks the index CUSTOM, implemented by `class_name`
        Builder& using_class(std::string class_name);

        /// Flat string option rendered in `WITH OPTIONS = {...}`; re-adding replaces
        Builder& option(std::string key, std::string value);

        /// Throws SpecificationError(MissingName) without a table or column
        [[nodiscard]] CreateIndexSpecification build() const;

    private:
        std::optional<cql::Identifier> name_;
        std::optional<cql::QualifiedName> table_;
        std::optional<cql::Identifier> column_;
        ColumnFunction function_{ColumnFunction::None};
        bool if_not_exists_{false};
        std::optional<std::string> using_class_;
        IndexOptions options_;
    };

    [[nodiscard]] static Builder builder() { return Builder(); }

    [[nodiscard]] const std::optional<cql::Identifier>& name() const noexcept { return name_; }
    [[nodiscard]] const cql::QualifiedName& table() const noexcept { return table_; }
    [[nodiscard]] const cql::Identifier& column() const noexcept { return column_; }
    [[nodiscard]] ColumnFunction column_function() const noexcept { return function_; }
    [[nodiscard]] bool if_not_exists() const noexcept { return if_not_exists_; }
    [[nodiscard]] bool is_custom() const noexcept { return using_class_.has_value(); }
    [[nodiscard]] const std::optional<std::string>& using_class() const noexcept { return using_class_; }
    [[nodiscard]] const IndexOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const CreateIndexSpecification& other) const {
        return name_ == other.name_ && table_ == other.table_ && column_ == other.column_ &&
               function_ == other.function_ && if_not_exists_ == other.if_not_exists_ &&
               using_class_ == other.using_class_ && options_ == other.options_;
    }

private:
    CreateIndexSpecification(std::optional<cql::Identifier> name, cql::QualifiedName table,
                             cql::Identifier column, ColumnFunction function, bool if_not_exists,
                             std::optional<std::string> using_class, IndexOptions options)
        : name_(std::move(name))
        , table_(std::move(table))
        , column_(std::move(column))
        , function_(function)
        , if_not_exists_(if_not_exists)
        , using_class_(std::move(using_class))
        , options_(std::move(options)) {}

    std::optional<cql::Identifier> name_;
    cql::QualifiedName table_;
    cql::Identifier column_;
    ColumnFunction function_;
    bool if_not_exists_;
    std::optional<std::string> using_class_;
    IndexOptions options_;
};

// ==============================================================================
// DROP INDEX
// ==============================================================================

class DropIndexSpecification {
public:
    class Builder {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& if_exists(bool value = true) {
            if_exists_ = value;
            return *this;
        }

        [[nodiscard]] DropIndexSpecification build() const {
            return DropIndexSpecification(name_, if_exists_);
        }

    private:
        cql::QualifiedName name_;
        bool if_exists_{false};
    };

    [[nodiscard]] static Builder builder(cql::QualifiedName name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::QualifiedName(cql::Identifier(name)));
    }

    [[nodiscard]] const cql::QualifiedName& name() const noexcept { return name_; }
    [[nodiscard]] bool if_exists() const noexcept { return if_exists_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const DropIndexSpecification& other) const {
        return name_ == other.name_ && if_exists_ == other.if_exists_;
    }

private:
    DropIndexSpecification(cql::QualifiedName name, bool if_exists)
        : name_(std::move(name)), if_exists_(if_exists) {}

    cql::QualifiedName name_;
    bool if_exists_;
};

} // namespace cqlgen::keyspace
