// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - CQL Generators                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "cqlgen/keyspace/specification.hpp"
#include "cqlgen/types.hpp"

#include <string>

namespace cqlgen::generator {

// ==============================================================================
// Per-statement generators
// ==============================================================================
//
// Each returns one statement terminated by `;`. Specifications that are
// structurally legal but cannot be expressed in CQL produce an Error instead
// of partial output.

[[nodiscard]] Result<std::string> generate(const keyspace::CreateKeyspaceSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::AlterKeyspaceSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::DropKeyspaceSpecification& spec);

[[nodiscard]] Result<std::string> generate(const keyspace::CreateTableSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::AlterTableSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::DropTableSpecification& spec);

[[nodiscard]] Result<std::string> generate(const keyspace::CreateIndexSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::DropIndexSpecification& spec);

[[nodiscard]] Result<std::string> generate(const keyspace::CreateUserTypeSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::AlterUserTypeSpecification& spec);
[[nodiscard]] Result<std::string> generate(const keyspace::DropUserTypeSpecification& spec);

// ==============================================================================
// Dispatcher
// ==============================================================================

/// Routes `spec` to the generator for its kind
[[nodiscard]] Result<std::string> to_cql(const keyspace::Specification& spec);

} // namespace cqlgen::generator
