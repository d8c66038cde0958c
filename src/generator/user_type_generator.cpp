// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - User Type Statement Generators                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/generator/generator.hpp"

#include <fmt/ranges.h>

#include <numeric>
#include <variant>
#include <vector>

namespace cqlgen::generator {

namespace {

/// Text so far, and whether the previous change was a RENAME
struct AlterTypeFold {
    std::string cql;
    bool previous_was_rename{false};
};

AlterTypeFold append_change(AlterTypeFold fold, const keyspace::ColumnChange& change) {
    const auto* rename = std::get_if<keyspace::RenameColumn>(&change);

    if (rename && fold.previous_was_rename) {
        fold.cql += fmt::format(" AND {} TO {}", rename->from.to_cql(), rename->to.to_cql());
    } else {
        fold.cql += ' ';
        fold.cql += keyspace::to_cql(change);
    }
    fold.previous_was_rename = rename != nullptr;
    return fold;
}

} // anonymous namespace

Result<std::string> generate(const keyspace::CreateUserTypeSpecification& spec) {
    std::vector<std::string> fields;
    fields.reserve(spec.fields().size());
    for (const auto& field : spec.fields()) {
        fields.push_back(field.to_cql());
    }

    return Ok(fmt::format("CREATE TYPE {}{} ({});",
        spec.if_not_exists() ? "IF NOT EXISTS " : "",
        spec.name().to_cql(),
        fmt::join(fields, ", ")));
}

Result<std::string> generate(const keyspace::AlterUserTypeSpecification& spec) {
    AlterTypeFold fold = std::accumulate(spec.changes().begin(), spec.changes().end(),
        AlterTypeFold{"ALTER TYPE " + spec.name().to_cql(), false}, append_change);

    fold.cql += ';';
    return Ok(std::move(fold.cql));
}

Result<std::string> generate(const keyspace::DropUserTypeSpecification& spec) {
    return Ok(fmt::format("DROP TYPE {}{};",
        spec.if_exists() ? "IF EXISTS " : "", spec.name().to_cql()));
}

} // namespace cqlgen::generator
