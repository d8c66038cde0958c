// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Keyspace Actions Unit Tests                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "cqlgen/generator/generator.hpp"
#include "cqlgen/keyspace/keyspace_actions.hpp"

using namespace cqlgen;
using namespace cqlgen::keyspace;

class KeyspaceActionsTest : public ::testing::Test {
protected:
    static std::string render(const Specification& spec) {
        auto cql = generator::to_cql(spec);
        EXPECT_TRUE(cql.has_value());
        return cql.has_value() ? *cql : std::string();
    }
};

// ==============================================================================
// Parsing
// ==============================================================================

TEST_F(KeyspaceActionsTest, ParseAction) {
    EXPECT_EQ(parse_keyspace_action("create"), KeyspaceAction::Create);
    EXPECT_EQ(parse_keyspace_action("CREATE_DROP"), KeyspaceAction::CreateDrop);
    EXPECT_EQ(parse_keyspace_action("Alter"), KeyspaceAction::Alter);
    EXPECT_EQ(parse_keyspace_action("none"), KeyspaceAction::None);
    EXPECT_FALSE(parse_keyspace_action("truncate").has_value());
}

// ==============================================================================
// Specification factories
// ==============================================================================

TEST_F(KeyspaceActionsTest, DurableWritesAlwaysAttached) {
    auto actions = KeyspaceActions::builder("ks").build();
    auto create = actions.create();

    EXPECT_TRUE(create.options().contains("durable_writes"));
    EXPECT_FALSE(create.options().contains("replication"));
    EXPECT_EQ(render(create),
        "CREATE KEYSPACE ks WITH durable_writes = false AND replication = { 'class' : "
        "'SimpleStrategy', 'replication_factor' : 1 };");
}

TEST_F(KeyspaceActionsTest, SimpleReplication) {
    auto actions = KeyspaceActions::builder("ks")
        .simple_replication(3)
        .durable_writes(true)
        .if_not_exists()
        .build();

    EXPECT_EQ(render(actions.create()),
        "CREATE KEYSPACE IF NOT EXISTS ks WITH durable_writes = true AND replication = "
        "{ 'class' : 'SimpleStrategy', 'replication_factor' : 3 };");
    EXPECT_EQ(render(actions.alter()),
        "ALTER KEYSPACE ks WITH durable_writes = true AND replication = "
        "{ 'class' : 'SimpleStrategy', 'replication_factor' : 3 };");
}

TEST_F(KeyspaceActionsTest, NetworkTopologyReplication) {
    auto actions = KeyspaceActions::builder("ks")
        .with_data_center({"dc1", 3})
        .with_data_center({"dc2", 2})
        .durable_writes(true)
        .build();

    EXPECT_EQ(render(actions.create()),
        "CREATE KEYSPACE ks WITH durable_writes = true AND replication = "
        "{ 'class' : 'NetworkTopologyStrategy', 'dc1' : 3, 'dc2' : 2 };");
}

TEST_F(KeyspaceActionsTest, QuotedNameFromCql) {
    auto actions = KeyspaceActions::builder("\"MyKeyspace\"").build();

    EXPECT_EQ(actions.name().unquoted(), "MyKeyspace");
    EXPECT_EQ(render(actions.drop()), "DROP KEYSPACE \"MyKeyspace\";");
}

// ==============================================================================
// Action expansion
// ==============================================================================

TEST_F(KeyspaceActionsTest, ForAction) {
    auto actions = KeyspaceActions::builder("ks").simple_replication(1).durable_writes(true).build();

    EXPECT_TRUE(actions.for_action(KeyspaceAction::None).empty());

    auto create = actions.for_action(KeyspaceAction::Create);
    ASSERT_EQ(create.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<CreateKeyspaceSpecification>(create[0]));

    auto alter = actions.for_action(KeyspaceAction::Alter);
    ASSERT_EQ(alter.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<AlterKeyspaceSpecification>(alter[0]));

    auto create_drop = actions.for_action(KeyspaceAction::CreateDrop);
    ASSERT_EQ(create_drop.size(), 2u);
    EXPECT_EQ(render(create_drop[0]), "DROP KEYSPACE IF EXISTS ks;");
    EXPECT_TRUE(std::holds_alternative<CreateKeyspaceSpecification>(create_drop[1]));
}
