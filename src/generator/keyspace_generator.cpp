// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Keyspace Statement Generators                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/generator/option_renderer.hpp"

#include <fmt/core.h>

namespace cqlgen::generator {

namespace {

// Replication and durable_writes are filled in on a copy; the caller's
// specification stays untouched.
keyspace::OptionsSpecification with_keyspace_defaults(const keyspace::OptionsSpecification& options) {
    keyspace::OptionsSpecification effective = options;

    const auto& replication = cql::to_option(cql::KeyspaceOption::Replication);
    if (!effective.contains(replication.name())) {
        effective.with(replication, cql::simple_replication(1));
    }

    const auto& durable_writes = cql::to_option(cql::KeyspaceOption::DurableWrites);
    if (!effective.contains(durable_writes.name())) {
        effective.with(durable_writes, true);
    }
    return effective;
}

} // anonymous namespace

Result<std::string> generate(const keyspace::CreateKeyspaceSpecification& spec) {
    std::string cql = "CREATE KEYSPACE ";
    if (spec.if_not_exists()) {
        cql += "IF NOT EXISTS ";
    }
    cql += spec.name().to_cql();
    cql += render_with_clause(with_keyspace_defaults(spec.options()));
    cql += ';';
    return Ok(std::move(cql));
}

Result<std::string> generate(const keyspace::AlterKeyspaceSpecification& spec) {
    if (spec.options().empty()) {
        return Err<std::string>(ErrorCode::IllegalSpecification,
            fmt::format("ALTER KEYSPACE {} requires at least one option", spec.name().to_cql()));
    }

    std::string cql = "ALTER KEYSPACE " + spec.name().to_cql();
    cql += render_with_clause(spec.options());
    cql += ';';
    return Ok(std::move(cql));
}

Result<std::string> generate(const keyspace::DropKeyspaceSpecification& spec) {
    return Ok(fmt::format("DROP KEYSPACE {}{};",
        spec.if_exists() ? "IF EXISTS " : "", spec.name().to_cql()));
}

} // namespace cqlgen::generator
