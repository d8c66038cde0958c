// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Specification Variant                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/keyspace/index_specification.hpp"
#include "cqlgen/keyspace/keyspace_specification.hpp"
#include "cqlgen/keyspace/table_specification.hpp"
#include "cqlgen/keyspace/user_type_specification.hpp"

#include <string>
#include <variant>

namespace cqlgen::keyspace {

/// Every schema change the generator knows how to render
using Specification = std::variant<
    CreateKeyspaceSpecification,
    AlterKeyspaceSpecification,
    DropKeyspaceSpecification,
    CreateTableSpecification,
    AlterTableSpecification,
    DropTableSpecification,
    CreateIndexSpecification,
    DropIndexSpecification,
    CreateUserTypeSpecification,
    AlterUserTypeSpecification,
    DropUserTypeSpecification>;

/// Human-readable summary used in logs and error messages
[[nodiscard]] std::string describe(const Specification& spec);

} // namespace cqlgen::keyspace
