// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Index Statement Generators                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/generator/option_renderer.hpp"

#include <fmt/core.h>

namespace cqlgen::generator {

Result<std::string> generate(const keyspace::CreateIndexSpecification& spec) {
    std::string cql = spec.is_custom() ? "CREATE CUSTOM INDEX " : "CREATE INDEX ";
    if (spec.if_not_exists()) {
        cql += "IF NOT EXISTS ";
    }
    if (spec.name()) {
        cql += spec.name()->to_cql();
        cql += ' ';
    }

    cql += "ON " + spec.table().to_cql() + " (";
    if (spec.column_function() == keyspace::ColumnFunction::None) {
        cql += spec.column().to_cql();
    } else {
        cql += fmt::format("{}({})",
            keyspace::column_function_to_string(spec.column_function()), spec.column().to_cql());
    }
    cql += ')';

    if (spec.is_custom()) {
        cql += " USING " + cql::single_quote(cql::escape_single(*spec.using_class()));
    }
    if (!spec.options().empty()) {
        cql += " WITH OPTIONS = " + render_index_options(spec.options());
    }
    cql += ';';
    return Ok(std::move(cql));
}

Result<std::string> generate(const keyspace::DropIndexSpecification& spec) {
    return Ok(fmt::format("DROP INDEX {}{};",
        spec.if_exists() ? "IF EXISTS " : "", spec.name().to_cql()));
}

} // namespace cqlgen::generator
