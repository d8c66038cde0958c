// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Specification Loader Tests                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "cqlgen/config/spec_loader.hpp"
#include "cqlgen/generator/generator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace cqlgen;
using namespace cqlgen::config;

class SpecLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "cqlgen_loader_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    /// Loads `text` and renders every specification
    std::vector<std::string> generate(const std::string& text) {
        auto specs = loader_.load_string(text);
        EXPECT_TRUE(specs.has_value()) << (specs.has_value() ? "" : specs.error().to_string());
        if (!specs.has_value()) {
            return {};
        }

        std::vector<std::string> statements;
        for (const auto& spec : specs.value()) {
            auto cql = generator::to_cql(spec);
            EXPECT_TRUE(cql.has_value()) << (cql.has_value() ? "" : cql.error().to_string());
            if (cql.has_value()) {
                statements.push_back(*cql);
            }
        }
        return statements;
    }

    std::filesystem::path test_dir_;
    SpecLoader loader_;
};

// ==============================================================================
// Registry
// ==============================================================================

TEST_F(SpecLoaderTest, BuiltInActions) {
    for (const char* action : {"CREATE_KEYSPACE", "CREATE_DROP_KEYSPACE", "ALTER_KEYSPACE",
                               "DROP_KEYSPACE", "CREATE_TABLE", "ALTER_TABLE", "DROP_TABLE",
                               "CREATE_INDEX", "DROP_INDEX", "CREATE_TYPE", "ALTER_TYPE",
                               "DROP_TYPE"}) {
        EXPECT_TRUE(loader_.has_action(action)) << action;
    }
    EXPECT_TRUE(loader_.has_action("create_table"));
    EXPECT_FALSE(loader_.has_action("TRUNCATE"));
    EXPECT_EQ(loader_.actions().size(), 12u);
}

namespace {

class ResetTableHandler : public ISpecHandler {
public:
    std::vector<keyspace::Specification> load(const nlohmann::ordered_json& args) const override {
        return {keyspace::DropTableSpecification::builder(args.at("name").get<std::string>())
                    .if_exists()
                    .build()};
    }
};

} // anonymous namespace

TEST_F(SpecLoaderTest, RegisterHandler) {
    loader_.register_handler("reset_table", std::make_unique<ResetTableHandler>());

    EXPECT_TRUE(loader_.has_action("RESET_TABLE"));
    EXPECT_EQ(generate(R"({"action": "reset_table", "name": "events"})"),
              std::vector<std::string>{"DROP TABLE IF EXISTS events;"});

    EXPECT_THROW(loader_.register_handler("nothing", nullptr), SpecificationError);
}

// ==============================================================================
// Keyspaces
// ==============================================================================

TEST_F(SpecLoaderTest, CreateKeyspace) {
    auto statements = generate(R"({
        "action": "CREATE_KEYSPACE",
        "name": "ks",
        "if_not_exists": true,
        "replication": {"strategy": "SimpleStrategy", "replication_factor": 3}
    })");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0],
        "CREATE KEYSPACE IF NOT EXISTS ks WITH durable_writes = true AND replication = "
        "{ 'class' : 'SimpleStrategy', 'replication_factor' : 3 };");
}

TEST_F(SpecLoaderTest, CreateDropKeyspaceWithDataCenters) {
    auto statements = generate(R"({
        "action": "CREATE_DROP_KEYSPACE",
        "name": "ks",
        "durable_writes": false,
        "replication": {
            "strategy": "NetworkTopologyStrategy",
            "data_centers": [
                {"name": "dc1", "replication_factor": 3},
                {"name": "dc2", "replication_factor": 1}
            ]
        }
    })");

    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(statements[0], "DROP KEYSPACE IF EXISTS ks;");
    EXPECT_EQ(statements[1],
        "CREATE KEYSPACE ks WITH durable_writes = false AND replication = "
        "{ 'class' : 'NetworkTopologyStrategy', 'dc1' : 3, 'dc2' : 1 };");
}

TEST_F(SpecLoaderTest, DataCenterNamesAreEscaped) {
    auto statements = generate(R"({
        "action": "CREATE_KEYSPACE",
        "name": "ks",
        "replication": {
            "strategy": "NetworkTopologyStrategy",
            "data_centers": [{"name": "dc'1", "replication_factor": 3}]
        }
    })");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0],
        "CREATE KEYSPACE ks WITH durable_writes = true AND replication = "
        "{ 'class' : 'NetworkTopologyStrategy', 'dc''1' : 3 };");
}

TEST_F(SpecLoaderTest, AlterKeyspaceOnlyTouchesGivenOptions) {
    auto statements = generate(R"({"action": "ALTER_KEYSPACE", "name": "ks", "durable_writes": false})");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0], "ALTER KEYSPACE ks WITH durable_writes = false;");
}

// ==============================================================================
// Tables
// ==============================================================================

TEST_F(SpecLoaderTest, CreateTable) {
    auto statements = generate(R"({
        "action": "CREATE_TABLE",
        "keyspace": "app",
        "name": "users",
        "if_not_exists": true,
        "columns": [
            {"name": "id", "type": "uuid", "key": "partition"},
            {"name": "ts", "type": "timestamp", "key": "cluster", "ordering": "DESC"},
            {"name": "tags", "type": "set<text>"}
        ],
        "options": {
            "comment": "User's profile",
            "compaction": {"class": "LeveledCompactionStrategy", "sstable_size_in_mb": 160},
            "gc_grace_seconds": 3600,
            "custom_flag": "on"
        }
    })");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0],
        "CREATE TABLE IF NOT EXISTS app.users (id uuid, ts timestamp, tags set<text>, "
        "PRIMARY KEY (id, ts)) WITH CLUSTERING ORDER BY (ts DESC) AND comment = 'User''s profile' "
        "AND compaction = { 'class' : 'LeveledCompactionStrategy', 'sstable_size_in_mb' : 160 } "
        "AND gc_grace_seconds = 3600 AND custom_flag = 'on';");
}

TEST_F(SpecLoaderTest, NestedStringValuesAreEscaped) {
    auto statements = generate(R"({
        "action": "CREATE_TABLE",
        "name": "t",
        "columns": [{"name": "k", "type": "text", "key": "partition"}],
        "options": {
            "compaction": {"class": "x'; DROP KEYSPACE prod; --", "label": "it's"}
        }
    })");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0],
        "CREATE TABLE t (k text, PRIMARY KEY (k)) WITH compaction = "
        "{ 'class' : 'x''; DROP KEYSPACE prod; --', 'label' : 'it''s' };");
}

TEST_F(SpecLoaderTest, CompactStorageFlag) {
    auto statements = generate(R"({
        "action": "CREATE_TABLE",
        "name": "legacy",
        "columns": [{"name": "k", "type": "text", "key": "partition"}],
        "options": {"COMPACT STORAGE": true}
    })");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0], "CREATE TABLE legacy (k text, PRIMARY KEY (k)) WITH COMPACT STORAGE;");
}

TEST_F(SpecLoaderTest, AlterTableChanges) {
    auto statements = generate(R"({
        "action": "ALTER_TABLE",
        "name": "users",
        "changes": [
            {"op": "add", "column": "age", "type": "int"},
            {"op": "drop", "column": "legacy"},
            {"op": "rename", "column": "id", "to": "user_id"}
        ]
    })");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0], "ALTER TABLE users ADD age int DROP legacy RENAME id TO user_id;");
}

TEST_F(SpecLoaderTest, AlterTableCompactStorageFailsAtGeneration) {
    auto specs = loader_.load_string(R"({
        "action": "ALTER_TABLE",
        "name": "users",
        "options": {"COMPACT STORAGE": true}
    })");
    ASSERT_TRUE(specs.has_value());
    ASSERT_EQ(specs->size(), 1u);

    auto cql = generator::to_cql(specs->front());
    ASSERT_FALSE(cql.has_value());
    EXPECT_EQ(cql.error().code(), ErrorCode::IllegalOption);
}

// ==============================================================================
// Indexes and types
// ==============================================================================

TEST_F(SpecLoaderTest, IndexesAndTypes) {
    auto statements = generate(R"([
        {"action": "CREATE_TYPE", "name": "address", "fields": [{"name": "street", "type": "text"}]},
        {"action": "ALTER_TYPE", "name": "address", "changes": [
            {"op": "RENAME", "column": "street", "to": "line1"},
            {"op": "RENAME", "column": "zip", "to": "postcode"}
        ]},
        {"action": "CREATE_INDEX", "name": "idx_email", "table": "users", "column": "email"},
        {"action": "CREATE_INDEX", "table": "users", "column": "attrs", "function": "entries",
         "using": "org.example.Index", "options": {"mode": "CONTAINS"}},
        {"action": "DROP_INDEX", "name": "idx_email", "if_exists": true},
        {"action": "DROP_TYPE", "name": "address"}
    ])");

    const std::vector<std::string> expected = {
        "CREATE TYPE address (street text);",
        "ALTER TYPE address RENAME street TO line1 AND zip TO postcode;",
        "CREATE INDEX idx_email ON users (email);",
        "CREATE CUSTOM INDEX ON users (ENTRIES(attrs)) USING 'org.example.Index' "
            "WITH OPTIONS = {'mode': 'CONTAINS'};",
        "DROP INDEX IF EXISTS idx_email;",
        "DROP TYPE address;",
    };
    EXPECT_EQ(statements, expected);
}

// ==============================================================================
// Errors
// ==============================================================================

TEST_F(SpecLoaderTest, MalformedJson) {
    auto specs = loader_.load_string("{\"action\": ");

    ASSERT_FALSE(specs.has_value());
    EXPECT_EQ(specs.error().code(), ErrorCode::ConfigParseError);
}

TEST_F(SpecLoaderTest, InvalidDocuments) {
    EXPECT_EQ(loader_.load_string("42").error().code(), ErrorCode::ConfigInvalid);
    EXPECT_EQ(loader_.load_string("[1]").error().code(), ErrorCode::ConfigInvalid);
    EXPECT_EQ(loader_.load_string(R"({"name": "t"})").error().code(), ErrorCode::ConfigInvalid);

    auto unknown = loader_.load_string(R"({"action": "TRUNCATE_TABLE", "name": "t"})");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::ConfigInvalid);
    EXPECT_NE(unknown.error().message().find("TRUNCATE_TABLE"), std::string::npos);
}

TEST_F(SpecLoaderTest, ConstructionErrorsBecomeResults) {
    auto missing_key = loader_.load_string(R"({
        "action": "CREATE_TABLE", "name": "t", "columns": [{"name": "a", "type": "text"}]
    })");
    ASSERT_FALSE(missing_key.has_value());
    EXPECT_EQ(missing_key.error().code(), ErrorCode::MissingPartitionKey);

    auto bad_name = loader_.load_string(R"({"action": "DROP_TABLE", "name": "no-dash"})");
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_EQ(bad_name.error().code(), ErrorCode::InvalidIdentifier);

    auto bad_type = loader_.load_string(R"({
        "action": "CREATE_TYPE", "name": "u", "fields": [{"name": "f", "type": "list<"}]
    })");
    ASSERT_FALSE(bad_type.has_value());
    EXPECT_EQ(bad_type.error().code(), ErrorCode::InvalidDataType);

    auto drop_field = loader_.load_string(R"({
        "action": "ALTER_TYPE", "name": "u", "changes": [{"op": "DROP", "column": "f"}]
    })");
    ASSERT_FALSE(drop_field.has_value());
    EXPECT_EQ(drop_field.error().code(), ErrorCode::ConfigInvalid);
}

TEST_F(SpecLoaderTest, UnknownOptionNamesMustBeIdentifiers) {
    for (const char* name : {"x = 1; DROP KEYSPACE prod; --", "two words", "1st", "select"}) {
        nlohmann::ordered_json document = {
            {"action", "CREATE_TABLE"},
            {"name", "t"},
            {"columns", {{{"name", "k"}, {"type", "text"}, {"key", "partition"}}}},
            {"options", {{name, "on"}}},
        };

        auto specs = loader_.load(document);
        ASSERT_FALSE(specs.has_value()) << name;
        EXPECT_EQ(specs.error().code(), ErrorCode::ConfigInvalid) << name;
    }
}

TEST_F(SpecLoaderTest, IntegerOutOfRange) {
    auto factor = loader_.load_string(R"({
        "action": "CREATE_KEYSPACE", "name": "ks",
        "replication": {"strategy": "SimpleStrategy", "replication_factor": 18446744073709551615}
    })");
    ASSERT_FALSE(factor.has_value());
    EXPECT_EQ(factor.error().code(), ErrorCode::ConfigInvalid);
    EXPECT_NE(factor.error().message().find("replication_factor"), std::string::npos);

    auto option = loader_.load_string(R"({
        "action": "CREATE_TABLE", "name": "t",
        "columns": [{"name": "k", "type": "text", "key": "partition"}],
        "options": {"gc_grace_seconds": 9223372036854775808}
    })");
    ASSERT_FALSE(option.has_value());
    EXPECT_EQ(option.error().code(), ErrorCode::ConfigInvalid);

    EXPECT_TRUE(loader_.load_string(R"({
        "action": "CREATE_KEYSPACE", "name": "ks",
        "replication": {"strategy": "SimpleStrategy", "replication_factor": 9223372036854775807}
    })").has_value());
}

TEST_F(SpecLoaderTest, ErrorNamesTheFailingAction) {
    auto specs = loader_.load_string(R"([
        {"action": "DROP_TABLE", "name": "ok"},
        {"action": "DROP_TABLE"}
    ])");

    ASSERT_FALSE(specs.has_value());
    EXPECT_NE(specs.error().message().find("action #1"), std::string::npos);
}

// ==============================================================================
// Files
// ==============================================================================

TEST_F(SpecLoaderTest, LoadFile) {
    const auto path = test_dir_ / "schema.json";
    {
        std::ofstream out(path);
        out << R"([{"action": "DROP_TABLE", "name": "a"}, {"action": "DROP_TABLE", "name": "b"}])";
    }

    auto specs = loader_.load_file(path);
    ASSERT_TRUE(specs.has_value());
    EXPECT_EQ(specs->size(), 2u);
}

TEST_F(SpecLoaderTest, MissingFile) {
    auto specs = loader_.load_file(test_dir_ / "missing.json");

    ASSERT_FALSE(specs.has_value());
    EXPECT_EQ(specs.error().code(), ErrorCode::FileNotFound);
}
