// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Embedded Usage Example                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "cqlgen/cqlgen.hpp"
#include "cqlgen/config.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <vector>

using namespace cqlgen;
using cql::DataType;

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== cqlgen Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", BUILD_TYPE, COMPILER_ID);

    std::vector<keyspace::Specification> specs;

    // Keyspace from replication settings
    auto keyspace_actions = keyspace::KeyspaceActions::builder("shop")
        .with_data_center({"dc1", 3})
        .with_data_center({"dc2", 2})
        .durable_writes(true)
        .if_not_exists()
        .build();
    for (auto& spec : keyspace_actions.for_action(keyspace::KeyspaceAction::Create)) {
        specs.push_back(std::move(spec));
    }

    // Schema objects
    try {
        specs.emplace_back(keyspace::CreateUserTypeSpecification::builder(
                cql::QualifiedName(cql::Identifier("address"), cql::Identifier("shop")))
            .if_not_exists()
            .field("street", DataType::text())
            .field("city", DataType::text())
            .field("zip", DataType::text())
            .build());

        specs.emplace_back(keyspace::CreateTableSpecification::builder(
                cql::QualifiedName(cql::Identifier("orders"), cql::Identifier("shop")))
            .if_not_exists()
            .partition_key_column("customer_id", DataType::uuid())
            .clustered_key_column("placed_at", DataType::timestamp(), keyspace::Ordering::Desc)
            .clustered_key_column("order_id", DataType::timeuuid())
            .column("items", DataType::map_of(DataType::text(), DataType::cint()))
            .column("ship_to", DataType::user_defined(cql::Identifier("address"), true))
            .with(cql::TableOption::Comment, std::string("orders by customer"))
            .with(cql::TableOption::DefaultTimeToLive, std::int64_t{0})
            .build());

        specs.emplace_back(keyspace::CreateIndexSpecification::builder()
            .name("orders_by_item")
            .table(cql::QualifiedName(cql::Identifier("orders"), cql::Identifier("shop")))
            .column("items", keyspace::ColumnFunction::Keys)
            .build());

        // Illegal on ALTER, reported by the generator rather than thrown
        specs.emplace_back(keyspace::AlterTableSpecification::builder("orders")
            .add("note", DataType::text())
            .with(cql::TableOption::CompactStorage)
            .build());
    } catch (const SpecificationError& e) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", e.what());
        return 1;
    }

    fmt::print("Generating {} statements...\n\n", specs.size());

    int failures = 0;
    for (const auto& spec : specs) {
        auto cql = generator::to_cql(spec);
        if (!cql) {
            fmt::print(fg(fmt::color::yellow), "-- rejected: {}\n", cql.error().to_string());
            ++failures;
            continue;
        }
        fmt::print("{}\n", cql.value());
    }

    // JSON documents go through the loader
    config::SpecLoader loader;
    auto loaded = loader.load_string(R"([
        {"action": "ALTER_TYPE", "keyspace": "shop", "name": "address",
         "changes": [{"op": "RENAME", "column": "zip", "to": "postcode"},
                     {"op": "RENAME", "column": "city", "to": "town"}]},
        {"action": "DROP_INDEX", "keyspace": "shop", "name": "orders_by_item", "if_exists": true}
    ])");
    if (!loaded) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", loaded.error().to_string());
        return 1;
    }
    for (const auto& spec : loaded.value()) {
        auto cql = generator::to_cql(spec);
        if (cql) {
            fmt::print("{}\n", cql.value());
        }
    }

    fmt::print(fg(fmt::color::green), "\nDone, {} specification(s) rejected as expected.\n", failures);
    return 0;
}
