// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Table Generator Unit Tests                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/keyspace/table_specification.hpp"

#include <cstdint>
#include <string>

using namespace cqlgen;
using namespace cqlgen::keyspace;
using cql::DataType;

class TableGeneratorTest : public ::testing::Test {
protected:
    static std::string render(const CreateTableSpecification& spec) {
        auto cql = generator::generate(spec);
        EXPECT_TRUE(cql.has_value()) << (cql.has_value() ? "" : cql.error().to_string());
        return cql.has_value() ? *cql : std::string();
    }

    static std::string render(const AlterTableSpecification& spec) {
        auto cql = generator::generate(spec);
        EXPECT_TRUE(cql.has_value()) << (cql.has_value() ? "" : cql.error().to_string());
        return cql.has_value() ? *cql : std::string();
    }
};

// ==============================================================================
// CREATE TABLE
// ==============================================================================

TEST_F(TableGeneratorTest, SinglePartitionKey) {
    auto spec = CreateTableSpecification::builder("users")
        .partition_key_column("id", DataType::uuid())
        .column("email", DataType::text())
        .build();

    EXPECT_EQ(render(spec), "CREATE TABLE users (id uuid, email text, PRIMARY KEY (id));");
}

TEST_F(TableGeneratorTest, CompositePartitionKey) {
    auto spec = CreateTableSpecification::builder("events")
        .partition_key_column("a", DataType::text())
        .partition_key_column("b", DataType::cint())
        .clustered_key_column("c", DataType::timeuuid())
        .column("payload", DataType::blob())
        .build();

    EXPECT_EQ(render(spec),
        "CREATE TABLE events (a text, b int, c timeuuid, payload blob, "
        "PRIMARY KEY ((a, b), c));");
}

TEST_F(TableGeneratorTest, ClusteringOrderOnlyForExplicitOrderings) {
    auto spec = CreateTableSpecification::builder("timeline")
        .if_not_exists()
        .partition_key_column("user_id", DataType::uuid())
        .clustered_key_column("posted", DataType::timestamp(), Ordering::Desc)
        .clustered_key_column("post_id", DataType::timeuuid())
        .with(cql::TableOption::Comment, std::string("per-user timeline"))
        .build();

    EXPECT_EQ(render(spec),
        "CREATE TABLE IF NOT EXISTS timeline (user_id uuid, posted timestamp, post_id timeuuid, "
        "PRIMARY KEY (user_id, posted, post_id)) WITH CLUSTERING ORDER BY (posted DESC) "
        "AND comment = 'per-user timeline';");
}

TEST_F(TableGeneratorTest, QualifiedNameAndOptions) {
    auto spec = CreateTableSpecification::builder(
            cql::QualifiedName(cql::Identifier("users"), cql::Identifier("app")))
        .partition_key_column("id", DataType::uuid())
        .column("tags", DataType::set_of(DataType::text()))
        .with(cql::TableOption::CompactStorage)
        .with(cql::TableOption::GcGraceSeconds, std::int64_t{86400})
        .build();

    EXPECT_EQ(render(spec),
        "CREATE TABLE app.users (id uuid, tags set<text>, PRIMARY KEY (id)) "
        "WITH COMPACT STORAGE AND gc_grace_seconds = 86400;");
}

TEST_F(TableGeneratorTest, ReservedColumnNamesAreQuoted) {
    auto spec = CreateTableSpecification::builder("t")
        .partition_key_column("key", DataType::text())
        .column("order", DataType::cint())
        .build();

    EXPECT_EQ(render(spec), "CREATE TABLE t (key text, \"order\" int, PRIMARY KEY (key));");
}

TEST_F(TableGeneratorTest, BuildValidation) {
    EXPECT_THROW((void)CreateTableSpecification::builder("t").build(), SpecificationError);

    try {
        (void)CreateTableSpecification::builder("t").column("a", DataType::text()).build();
        FAIL() << "expected SpecificationError";
    } catch (const SpecificationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingPartitionKey);
    }

    try {
        (void)CreateTableSpecification::builder("t")
            .partition_key_column("a", DataType::text())
            .column("a", DataType::cint())
            .build();
        FAIL() << "expected SpecificationError";
    } catch (const SpecificationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateColumn);
    }
}

TEST_F(TableGeneratorTest, OrderingRequiresClusteringColumn) {
    EXPECT_THROW(ColumnSpecification(cql::Identifier("a"), DataType::text(),
                                     KeyRole::Partition, Ordering::Asc),
                 SpecificationError);
}

// ==============================================================================
// ALTER TABLE
// ==============================================================================

TEST_F(TableGeneratorTest, AlterChangesInOrder) {
    auto spec = AlterTableSpecification::builder("users")
        .add("age", DataType::cint())
        .drop("legacy")
        .alter("email", DataType::varchar())
        .rename("id", "user_id")
        .build();

    EXPECT_EQ(render(spec),
        "ALTER TABLE users ADD age int DROP legacy ALTER email TYPE varchar RENAME id TO user_id;");
}

TEST_F(TableGeneratorTest, AlterWithOptionsOnly) {
    auto spec = AlterTableSpecification::builder("users")
        .with(cql::TableOption::DefaultTimeToLive, std::int64_t{600})
        .build();

    EXPECT_EQ(render(spec), "ALTER TABLE users WITH default_time_to_live = 600;");
}

TEST_F(TableGeneratorTest, AlterRejectsCompactStorage) {
    auto spec = AlterTableSpecification::builder("users")
        .add("age", DataType::cint())
        .with(cql::TableOption::CompactStorage)
        .build();

    auto cql = generator::generate(spec);
    ASSERT_FALSE(cql.has_value());
    EXPECT_EQ(cql.error().code(), ErrorCode::IllegalOption);
    EXPECT_NE(cql.error().message().find("COMPACT STORAGE"), std::string::npos);
}

TEST_F(TableGeneratorTest, AlterWithoutChangesThrows) {
    EXPECT_THROW((void)AlterTableSpecification::builder("users").build(), SpecificationError);
}

// ==============================================================================
// DROP TABLE
// ==============================================================================

TEST_F(TableGeneratorTest, Drop) {
    auto plain = generator::generate(DropTableSpecification::builder("users").build());
    auto guarded = generator::generate(DropTableSpecification::builder("users").if_exists().build());

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(guarded.has_value());
    EXPECT_EQ(*plain, "DROP TABLE users;");
    EXPECT_EQ(*guarded, "DROP TABLE IF EXISTS users;");
}
