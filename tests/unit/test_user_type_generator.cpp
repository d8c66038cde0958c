// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - User Type Generator Unit Tests                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/keyspace/user_type_specification.hpp"

using namespace cqlgen;
using namespace cqlgen::keyspace;
using cql::DataType;

// ==============================================================================
// CREATE TYPE
// ==============================================================================

TEST(UserTypeGeneratorTest, Create) {
    auto spec = CreateUserTypeSpecification::builder("address")
        .field("street", DataType::text())
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql, "CREATE TYPE address (street text);");
}

TEST(UserTypeGeneratorTest, CreateQualifiedIfNotExists) {
    auto spec = CreateUserTypeSpecification::builder(
            cql::QualifiedName(cql::Identifier("address"), cql::Identifier("app")))
        .if_not_exists()
        .field("street", DataType::text())
        .field("zip", DataType::cint())
        .field("phones", DataType::list_of(DataType::text()))
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql,
        "CREATE TYPE IF NOT EXISTS app.address (street text, zip int, phones list<text>);");
}

TEST(UserTypeGeneratorTest, EmptyFieldListFailsConstruction) {
    try {
        (void)CreateUserTypeSpecification::builder("address").build();
        FAIL() << "expected SpecificationError";
    } catch (const SpecificationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmptyColumnList);
    }

    EXPECT_THROW((void)CreateUserTypeSpecification::builder("address")
                     .field("street", DataType::text())
                     .field("street", DataType::varchar())
                     .build(),
                 SpecificationError);
}

// ==============================================================================
// ALTER TYPE
// ==============================================================================

TEST(UserTypeGeneratorTest, AlterAddAndAlter) {
    auto spec = AlterUserTypeSpecification::builder("address")
        .add("country", DataType::text())
        .alter("zip", DataType::varchar())
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql, "ALTER TYPE address ADD country text ALTER zip TYPE varchar;");
}

TEST(UserTypeGeneratorTest, ConsecutiveRenamesAreMerged) {
    auto spec = AlterUserTypeSpecification::builder("address")
        .rename("street", "street_line")
        .rename("zip", "postcode")
        .rename("town", "city")
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql,
        "ALTER TYPE address RENAME street TO street_line AND zip TO postcode AND town TO city;");
}

TEST(UserTypeGeneratorTest, RenameAfterOtherChangeStartsNewClause) {
    auto spec = AlterUserTypeSpecification::builder("address")
        .rename("a", "b")
        .add("c", DataType::text())
        .rename("d", "e")
        .rename("f", "g")
        .build();

    auto cql = generator::generate(spec);
    ASSERT_TRUE(cql.has_value());
    EXPECT_EQ(*cql, "ALTER TYPE address RENAME a TO b ADD c text RENAME d TO e AND f TO g;");
}

TEST(UserTypeGeneratorTest, EmptyChangeListFailsConstruction) {
    try {
        (void)AlterUserTypeSpecification::builder("address").build();
        FAIL() << "expected SpecificationError";
    } catch (const SpecificationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmptyChangeList);
    }
}

// ==============================================================================
// DROP TYPE
// ==============================================================================

TEST(UserTypeGeneratorTest, Drop) {
    auto plain = generator::generate(DropUserTypeSpecification::builder("address").build());
    auto guarded = generator::generate(DropUserTypeSpecification::builder("address").if_exists().build());

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(guarded.has_value());
    EXPECT_EQ(*plain, "DROP TYPE address;");
    EXPECT_EQ(*guarded, "DROP TYPE IF EXISTS address;");
}
