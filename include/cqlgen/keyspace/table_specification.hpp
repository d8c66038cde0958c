// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Table Specifications                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/keyspace/column_specification.hpp"
#include "cqlgen/keyspace/options_specification.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cqlgen::keyspace {

// ==============================================================================
// CREATE TABLE
// ==============================================================================

class CreateTableSpecification {
public:
    class Builder : public OptionsBuilder<Builder> {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& if_not_exists(bool value = true) {
            if_not_exists_ = value;
            return *this;
        }

        /// Regular (non-key) column
        Builder& column(cql::Identifier name, cql::DataType type);
        Builder& column(std::string_view name, cql::DataType type) {
            return column(cql::Identifier(name), std::move(type));
        }

        Builder& partition_key_column(cql::Identifier name, cql::DataType type);
        Builder& partition_key_column(std::string_view name, cql::DataType type) {
            return partition_key_column(cql::Identifier(name), std::move(type));
        }

        /// Without an ordering the column is left out of CLUSTERING ORDER BY
        Builder& clustered_key_column(cql::Identifier name, cql::DataType type,
                                      std::optional<Ordering> ordering = std::nullopt);
        Builder& clustered_key_column(std::string_view name, cql::DataType type,
                                      std::optional<Ordering> ordering = std::nullopt) {
            return clustered_key_column(cql::Identifier(name), std::move(type), ordering);
        }

        /// Throws SpecificationError if there are no columns, no partition
        /// key column, or a column name repeats.
        [[nodiscard]] CreateTableSpecification build() const;

    private:
        cql::QualifiedName name_;
        bool if_not_exists_{false};
        std::vector<ColumnSpecification> columns_;
    };

    [[nodiscard]] static Builder builder(cql::QualifiedName name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::QualifiedName(cql::Identifier(name)));
    }

    [[nodiscard]] const cql::QualifiedName& name() const noexcept { return name_; }
    [[nodiscard]] bool if_not_exists() const noexcept { return if_not_exists_; }
    [[nodiscard]] const std::vector<ColumnSpecification>& columns() const noexcept { return columns_; }
    [[nodiscard]] const OptionsSpecification& options() const noexcept { return options_; }

    [[nodiscard]] std::vector<ColumnSpecification> partition_key_columns() const;
    [[nodiscard]] std::vector<ColumnSpecification> clustered_key_columns() const;

    [[nodiscard]] std::string describe() const;

    bool operator==(const CreateTableSpecification& other) const {
        return name_ == other.name_ && if_not_exists_ == other.if_not_exists_ &&
               columns_ == other.columns_ && options_ == other.options_;
    }

private:
    CreateTableSpecification(cql::QualifiedName name, bool if_not_exists,
                             std::vector<ColumnSpecification> columns, OptionsSpecification options)
        : name_(std::move(name))
        , if_not_exists_(if_not_exists)
        , columns_(std::move(columns))
        , options_(std::move(options)) {}

    cql::QualifiedName name_;
    bool if_not_exists_;
    std::vector<ColumnSpecification> columns_;
    OptionsSpecification options_;
};

// ==============================================================================
// ALTER TABLE
// ==============================================================================

class AlterTableSpecification {
public:
    class Builder : public OptionsBuilder<Builder> {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& add(cql::Identifier name, cql::DataType type);
        Builder& add(std::string_view name, cql::DataType type) {
            return add(cql::Identifier(name), std::move(type));
        }

        Builder& drop(cql::Identifier name);
        Builder& drop(std::string_view name) { return drop(cql::Identifier(name)); }

        Builder& alter(cql::Identifier name, cql::DataType type);
        Builder& alter(std::string_view name, cql::DataType type) {
            return alter(cql::Identifier(name), std::move(type));
        }

        Builder& rename(cql::Identifier from, cql::Identifier to);
        Builder& rename(std::string_view from, std::string_view to) {
            return rename(cql::Identifier(from), cql::Identifier(to));
        }

        /// Throws SpecificationError(EmptyChangeList) with neither changes nor options
        [[nodiscard]] AlterTableSpecification build() const;

    private:
        cql::QualifiedName name_;
        std::vector<ColumnChange> changes_;
    };

    [[nodiscard]] static Builder builder(cql::QualifiedName name) { return Builder(std::move(name)); }
    [[nodiscard]] static Builder builder(std::string_view name) {
        return Builder(cql::QualifiedName(cql::Identifier(name)));
    }

    [[nodiscard]] const cql::QualifiedName& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<ColumnChange>& changes() const noexcept { return changes_; }
    [[nodiscard]] const OptionsSpecification& options() const noexcept { return options_; }

    [[nodiscard]] std::string describe() const;

    bool operator==(const AlterTableSpecification& other) const {
        return name_ == other.name_ && changes_ == other.changes_ && options_ == other.options_;
    }

private:
    AlterTableSpecification(cql::QualifiedName name, std::vector<ColumnChange> changes,
                            OptionsSpecification options)
        : name_(std::move(name)), changes_(std::move(changes)), options_(std::move(options)) {}

    cql::QualifiedName name_;
    std::vector<ColumnChange> changes_;
    OptionsSpecification options_;
};

// ==============================================================================
// DROP TABLE
// ==============================================================================

class DropTableSpecification {
public:
    class Builder {
    public:
        explicit Builder(cql::QualifiedName name) : name_(std::move(name)) {}

        Builder& if_exists(bool value = true) {
            if_exists_ = value;
            return *this;
        }

        [[nodiscard]] DropTableSpecification build() const {
            return DropTableSpecification(name_, if_exists_);
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

    bool operator==(const DropTableSpecification& other) const {
        return name_ == other.name_ && if_exists_ == other.if_exists_;
    }

private:
    DropTableSpecification(cql::QualifiedName name, bool if_exists)
        : name_(std::move(name)), if_exists_(if_exists) {}

    cql::QualifiedName name_;
    bool if_exists_;
};

} // namespace cqlgen::keyspace
