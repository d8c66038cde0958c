// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Index Generator Unit Tests                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/keyspace/index_specification.hpp"

using namespace cqlgen;
using namespace cqlgen::keyspace;

// ==============================================================================
// CREATE INDEX
// ==============================================================================

TEST(IndexGeneratorTest, NamedIndex) {
    auto spec = CreateIndexSpecification::builder()
        .name("idx_email")
        .table("users")
        .column("email")
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql, "CREATE INDEX idx_email ON users (email);");
}

TEST(IndexGeneratorTest, UnnamedIndexWithFunction) {
    auto spec = CreateIndexSpecification::builder()
        .if_not_exists()
        .table(cql::QualifiedName(cql::Identifier("users"), cql::Identifier("app")))
        .column("attributes", ColumnFunction::Keys)
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql, "CREATE INDEX IF NOT EXISTS ON app.users (KEYS(attributes));");
}

TEST(IndexGeneratorTest, CustomIndexWithOptions) {
    auto spec = CreateIndexSpecification::builder()
        .name("idx_bio")
        .table("users")
        .column("bio")
        .using_class("org.apache.cassandra.index.sasi.SASIIndex")
        .option("mode", "CONTAINS")
        .option("analyzed", "true")
        .option("mode", "PREFIX")
        .build();

    EXPECT_TRUE(spec.is_custom());
    ASSERT_EQ(spec.options().size(), 2u);

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql,
        "CREATE CUSTOM INDEX idx_bio ON users (bio) USING "
        "'org.apache.cassandra.index.sasi.SASIIndex' WITH OPTIONS = "
        "{'mode': 'PREFIX', 'analyzed': 'true'};");
}

TEST(IndexGeneratorTest, BuildValidation) {
    EXPECT_THROW((void)CreateIndexSpecification::builder().column("email").build(),
                 SpecificationError);
    EXPECT_THROW((void)CreateIndexSpecification::builder().table("users").build(),
                 SpecificationError);
    EXPECT_THROW(CreateIndexSpecification::builder().using_class(""), SpecificationError);
}

// ==============================================================================
// DROP INDEX
// ==============================================================================

TEST(IndexGeneratorTest, Drop) {
    auto plain = generator::generate(DropIndexSpecification::builder("idx_email").build());
    auto guarded = generator::generate(DropIndexSpecification::builder(
        cql::QualifiedName(cql::Identifier("idx_email"), cql::Identifier("app"))).if_exists().build());

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(guarded.has_value());
    EXPECT_EQ(*plain, "DROP INDEX idx_email;");
    EXPECT_EQ(*guarded, "DROP INDEX IF EXISTS app.idx_email;");
}
