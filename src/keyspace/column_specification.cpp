// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Column Specifications Implementation                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/column_specification.hpp"
#include "cqlgen/types.hpp"
#include "utils/overloaded.hpp"

#include <fmt/core.h>

namespace cqlgen::keyspace {

ColumnSpecification::ColumnSpecification(cql::Identifier name, cql::DataType type,
                                         KeyRole role, std::optional<Ordering> ordering)
    : name_(std::move(name))
    , type_(std::move(type))
    , role_(role)
    , ordering_(ordering) {
    if (ordering_ && role_ != KeyRole::Cluster) {
        throw SpecificationError(ErrorCode::InvalidArgument,
            fmt::format("column [{}] is not a clustering column and cannot be ordered",
                name_.to_cql()));
    }
}

std::string ColumnSpecification::to_cql() const {
    return name_.to_cql() + " " + type_.to_cql();
}

std::string to_cql(const ColumnChange& change) {
    return std::visit(overloaded{
        [](const AddColumn& c) { return "ADD " + c.name.to_cql() + " " + c.type.to_cql(); },
        [](const DropColumn& c) { return "DROP " + c.name.to_cql(); },
        [](const AlterColumn& c) { return "ALTER " + c.name.to_cql() + " TYPE " + c.type.to_cql(); },
        [](const RenameColumn& c) { return "RENAME " + c.from.to_cql() + " TO " + c.to.to_cql(); },
    }, change);
}

} // namespace cqlgen::keyspace
