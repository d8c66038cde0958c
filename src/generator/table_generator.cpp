// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Table Statement Generators                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/generator/option_renderer.hpp"

#include <fmt/ranges.h>

#include <vector>

namespace cqlgen::generator {

namespace {

std::string names_of(const std::vector<keyspace::ColumnSpecification>& columns) {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name().to_cql());
    }
    return fmt::format("{}", fmt::join(names, ", "));
}

/// `PRIMARY KEY (a, c)` or `PRIMARY KEY ((a, b), c)`
std::string primary_key_clause(const keyspace::CreateTableSpecification& spec) {
    const auto partition = spec.partition_key_columns();
    const auto clustered = spec.clustered_key_columns();

    std::string clause = "PRIMARY KEY (";
    clause += partition.size() > 1 ? "(" + names_of(partition) + ")" : names_of(partition);
    if (!clustered.empty()) {
        clause += ", " + names_of(clustered);
    }
    clause += ')';
    return clause;
}

/// Empty unless at least one clustering column carries an explicit ordering
std::vector<std::string> clustering_order_clause(const keyspace::CreateTableSpecification& spec) {
    std::vector<std::string> orderings;
    for (const auto& column : spec.clustered_key_columns()) {
        if (column.ordering()) {
            orderings.push_back(fmt::format("{} {}",
                column.name().to_cql(), keyspace::ordering_to_string(*column.ordering())));
        }
    }

    if (orderings.empty()) {
        return {};
    }
    return {fmt::format("CLUSTERING ORDER BY ({})", fmt::join(orderings, ", "))};
}

} // anonymous namespace

Result<std::string> generate(const keyspace::CreateTableSpecification& spec) {
    std::vector<std::string> definitions;
    definitions.reserve(spec.columns().size() + 1);
    for (const auto& column : spec.columns()) {
        definitions.push_back(column.to_cql());
    }
    definitions.push_back(primary_key_clause(spec));

    std::string cql = "CREATE TABLE ";
    if (spec.if_not_exists()) {
        cql += "IF NOT EXISTS ";
    }
    cql += spec.name().to_cql();
    cql += fmt::format(" ({})", fmt::join(definitions, ", "));
    cql += render_with_clause(spec.options(), clustering_order_clause(spec));
    cql += ';';
    return Ok(std::move(cql));
}

Result<std::string> generate(const keyspace::AlterTableSpecification& spec) {
    const auto& compact_storage = cql::to_option(cql::TableOption::CompactStorage);
    if (spec.options().contains(compact_storage.name())) {
        return Err<std::string>(ErrorCode::IllegalOption,
            fmt::format("ALTER TABLE {} cannot use option [{}]",
                spec.name().to_cql(), compact_storage.name()));
    }

    std::string cql = "ALTER TABLE " + spec.name().to_cql();
    for (const auto& change : spec.changes()) {
        cql += ' ';
        cql += keyspace::to_cql(change);
    }
    cql += render_with_clause(spec.options());
    cql += ';';
    return Ok(std::move(cql));
}

Result<std::string> generate(const keyspace::DropTableSpecification& spec) {
    return Ok(fmt::format("DROP TABLE {}{};",
        spec.if_exists() ? "IF EXISTS " : "", spec.name().to_cql()));
}

} // namespace cqlgen::generator
