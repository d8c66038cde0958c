// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Table Specifications Implementation                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/table_specification.hpp"
#include "cqlgen/types.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <set>

namespace cqlgen::keyspace {

namespace {

std::vector<ColumnSpecification> columns_with_role(
    const std::vector<ColumnSpecification>& columns, KeyRole role) {
    std::vector<ColumnSpecification> selected;
    std::copy_if(columns.begin(), columns.end(), std::back_inserter(selected),
        [role](const ColumnSpecification& column) { return column.key_role() == role; });
    return selected;
}

} // anonymous namespace

// ==============================================================================
// CREATE TABLE
// ==============================================================================

CreateTableSpecification::Builder&
CreateTableSpecification::Builder::column(cql::Identifier name, cql::DataType type) {
    columns_.emplace_back(std::move(name), std::move(type));
    return *this;
}

CreateTableSpecification::Builder&
CreateTableSpecification::Builder::partition_key_column(cql::Identifier name, cql::DataType type) {
    columns_.emplace_back(std::move(name), std::move(type), KeyRole::Partition);
    return *this;
}

CreateTableSpecification::Builder&
CreateTableSpecification::Builder::clustered_key_column(cql::Identifier name, cql::DataType type,
                                                        std::optional<Ordering> ordering) {
    columns_.emplace_back(std::move(name), std::move(type), KeyRole::Cluster, ordering);
    return *this;
}

CreateTableSpecification CreateTableSpecification::Builder::build() const {
    if (columns_.empty()) {
        throw SpecificationError(ErrorCode::EmptyColumnList,
            fmt::format("table [{}] must have at least one column", name_.to_cql()));
    }

    const bool has_partition_key = std::any_of(columns_.begin(), columns_.end(),
        [](const ColumnSpecification& column) { return column.is_partition_key(); });
    if (!has_partition_key) {
        throw SpecificationError(ErrorCode::MissingPartitionKey,
            fmt::format("table [{}] must have at least one partition key column", name_.to_cql()));
    }

    std::set<cql::Identifier> seen;
    for (const auto& column : columns_) {
        if (!seen.insert(column.name()).second) {
            throw SpecificationError(ErrorCode::DuplicateColumn,
                fmt::format("table [{}] declares column [{}] more than once",
                    name_.to_cql(), column.name().to_cql()));
        }
    }

    return CreateTableSpecification(name_, if_not_exists_, columns_, options_);
}

std::vector<ColumnSpecification> CreateTableSpecification::partition_key_columns() const {
    return columns_with_role(columns_, KeyRole::Partition);
}

std::vector<ColumnSpecification> CreateTableSpecification::clustered_key_columns() const {
    return columns_with_role(columns_, KeyRole::Cluster);
}

std::string CreateTableSpecification::describe() const {
    return fmt::format("CreateTableSpecification[name={}, if_not_exists={}, columns={}, options={}]",
        name_.to_cql(), if_not_exists_, columns_.size(), options_.size());
}

// ==============================================================================
// ALTER TABLE
// ==============================================================================

AlterTableSpecification::Builder&
AlterTableSpecification::Builder::add(cql::Identifier name, cql::DataType type) {
    changes_.emplace_back(AddColumn{std::move(name), std::move(type)});
    return *this;
}

AlterTableSpecification::Builder& AlterTableSpecification::Builder::drop(cql::Identifier name) {
    changes_.emplace_back(DropColumn{std::move(name)});
    return *this;
}

AlterTableSpecification::Builder&
AlterTableSpecification::Builder::alter(cql::Identifier name, cql::DataType type) {
    changes_.emplace_back(AlterColumn{std::move(name), std::move(type)});
    return *this;
}

AlterTableSpecification::Builder&
AlterTableSpecification::Builder::rename(cql::Identifier from, cql::Identifier to) {
    changes_.emplace_back(RenameColumn{std::move(from), std::move(to)});
    return *this;
}

AlterTableSpecification AlterTableSpecification::Builder::build() const {
    if (changes_.empty() && options_.empty()) {
        throw SpecificationError(ErrorCode::EmptyChangeList,
            fmt::format("alter of table [{}] has neither column changes nor options", name_.to_cql()));
    }
    return AlterTableSpecification(name_, changes_, options_);
}

std::string AlterTableSpecification::describe() const {
    return fmt::format("AlterTableSpecification[name={}, changes={}, options={}]",
        name_.to_cql(), changes_.size(), options_.size());
}

// ==============================================================================
// DROP TABLE
// ==============================================================================

std::string DropTableSpecification::describe() const {
    return fmt::format("DropTableSpecification[name={}, if_exists={}]", name_.to_cql(), if_exists_);
}

} // namespace cqlgen::keyspace
