// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Keyspace Specifications Implementation                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/keyspace/keyspace_specification.hpp"

#include <fmt/core.h>

namespace cqlgen::keyspace {

// ==============================================================================
// CREATE KEYSPACE
// ==============================================================================

CreateKeyspaceSpecification::Builder&
CreateKeyspaceSpecification::Builder::with_simple_replication(std::int64_t replication_factor) {
    return with(cql::KeyspaceOption::Replication, cql::simple_replication(replication_factor));
}

CreateKeyspaceSpecification::Builder&
CreateKeyspaceSpecification::Builder::with_network_replication(
    const std::vector<std::pair<std::string, std::int64_t>>& data_centers) {
    return with(cql::KeyspaceOption::Replication, cql::network_replication(data_centers));
}

CreateKeyspaceSpecification::Builder&
CreateKeyspaceSpecification::Builder::with_durable_writes(bool value) {
    return with(cql::KeyspaceOption::DurableWrites, value);
}

CreateKeyspaceSpecification CreateKeyspaceSpecification::Builder::build() const {
    return CreateKeyspaceSpecification(name_, if_not_exists_, options_);
}

std::string CreateKeyspaceSpecification::describe() const {
    return fmt::format("CreateKeyspaceSpecification[name={}, if_not_exists={}, options={}]",
        name_.to_cql(), if_not_exists_, options_.size());
}

// ==============================================================================
// ALTER KEYSPACE
// ==============================================================================

AlterKeyspaceSpecification::Builder&
AlterKeyspaceSpecification::Builder::with_simple_replication(std::int64_t replication_factor) {
    return with(cql::KeyspaceOption::Replication, cql::simple_replication(replication_factor));
}

AlterKeyspaceSpecification::Builder&
AlterKeyspaceSpecification::Builder::with_network_replication(
    const std::vector<std::pair<std::string, std::int64_t>>& data_centers) {
    return with(cql::KeyspaceOption::Replication, cql::network_replication(data_centers));
}

AlterKeyspaceSpecification::Builder&
AlterKeyspaceSpecification::Builder::with_durable_writes(bool value) {
    return with(cql::KeyspaceOption::DurableWrites, value);
}

AlterKeyspaceSpecification AlterKeyspaceSpecification::Builder::build() const {
    return AlterKeyspaceSpecification(name_, options_);
}

std::string AlterKeyspaceSpecification::describe() const {
    return fmt::format("AlterKeyspaceSpecification[name={}, options={}]",
        name_.to_cql(), options_.size());
}

// ==============================================================================
// DROP KEYSPACE
// ==============================================================================

std::string DropKeyspaceSpecification::describe() const {
    return fmt::format("DropKeyspaceSpecification[name={}, if_exists={}]",
        name_.to_cql(), if_exists_);
}

} // namespace cqlgen::keyspace
