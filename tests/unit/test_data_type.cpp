// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Data Type Unit Tests                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include <string>

#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/types.hpp"

using namespace cqlgen;
using namespace cqlgen::cql;

// ==============================================================================
// Rendering
// ==============================================================================

TEST(DataTypeTest, NativeTypes) {
    EXPECT_EQ(DataType::text().to_cql(), "text");
    EXPECT_EQ(DataType::cint().to_cql(), "int");
    EXPECT_EQ(DataType::timeuuid().to_cql(), "timeuuid");
    EXPECT_EQ(DataType::native(NativeType::Varint).to_cql(), "varint");
    EXPECT_EQ(DataType::text().kind(), DataType::Kind::Native);
}

TEST(DataTypeTest, Collections) {
    auto tags = DataType::set_of(DataType::text());
    auto scores = DataType::map_of(DataType::text(), DataType::list_of(DataType::cint(), true));

    EXPECT_EQ(tags.to_cql(), "set<text>");
    EXPECT_EQ(scores.to_cql(), "map<text, frozen<list<int>>>");
    EXPECT_TRUE(scores.is_collection());
    EXPECT_EQ(scores.type_arguments().size(), 2u);
}

TEST(DataTypeTest, TupleAndUserDefined) {
    auto point = DataType::tuple_of({DataType::cdouble(), DataType::cdouble()});
    auto address = DataType::user_defined(Identifier("address"), true);

    EXPECT_EQ(point.to_cql(), "tuple<double, double>");
    EXPECT_FALSE(point.is_collection());
    EXPECT_EQ(address.to_cql(), "frozen<address>");

    EXPECT_THROW(DataType::tuple_of({}), SpecificationError);
}

TEST(DataTypeTest, FrozenCopy) {
    auto list = DataType::list_of(DataType::text());
    auto frozen = list.frozen();

    EXPECT_FALSE(list.is_frozen());
    EXPECT_TRUE(frozen.is_frozen());
    EXPECT_EQ(frozen.to_cql(), "frozen<list<text>>");

    // Native types have nothing to freeze
    EXPECT_EQ(DataType::text().frozen(), DataType::text());
}

// ==============================================================================
// Parsing
// ==============================================================================

TEST(DataTypeParseTest, Natives) {
    EXPECT_EQ(DataType::parse("text"), DataType::text());
    EXPECT_EQ(DataType::parse("  BIGINT "), DataType::bigint());
}

TEST(DataTypeParseTest, NestedTypes) {
    auto parsed = DataType::parse("map<text, frozen<list<int>>>");

    EXPECT_EQ(parsed.kind(), DataType::Kind::Map);
    EXPECT_EQ(parsed,
        DataType::map_of(DataType::text(), DataType::list_of(DataType::cint(), true)));
}

TEST(DataTypeParseTest, RenderThenParse) {
    for (const char* text : {"set<uuid>", "tuple<int, text, boolean>",
                             "frozen<map<text, address>>", "list<frozen<tuple<int, int>>>"}) {
        auto type = DataType::parse(text);
        EXPECT_EQ(type.to_cql(), text);
        EXPECT_EQ(DataType::parse(type.to_cql()), type);
    }
}

TEST(DataTypeParseTest, UserDefinedNames) {
    EXPECT_EQ(DataType::parse("address"), DataType::user_defined(Identifier("address")));
    EXPECT_EQ(DataType::parse("\"Address\"").to_cql(), "\"Address\"");
}

TEST(DataTypeParseTest, MalformedInput) {
    EXPECT_THROW(DataType::parse(""), SpecificationError);
    EXPECT_THROW(DataType::parse("list<text"), SpecificationError);
    EXPECT_THROW(DataType::parse("map<text>"), SpecificationError);
    EXPECT_THROW(DataType::parse("text>"), SpecificationError);
    EXPECT_THROW(DataType::parse("tuple<>"), SpecificationError);

    try {
        (void)DataType::parse("set<int,");
        FAIL() << "expected SpecificationError";
    } catch (const SpecificationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidDataType);
        EXPECT_NE(std::string(e.what()).find("set<int,"), std::string::npos);
    }
}

TEST(DataTypeParseTest, NestingDepthLimit) {
    auto nested = [](const char* wrapper, std::size_t levels) {
        std::string text;
        for (std::size_t i = 0; i < levels; ++i) text += wrapper;
        text += "int";
        text.append(levels, '>');
        return text;
    };

    auto deepest = DataType::parse(nested("list<", 63));
    EXPECT_EQ(deepest.kind(), DataType::Kind::List);

    EXPECT_THROW(DataType::parse(nested("list<", 64)), SpecificationError);

    try {
        (void)DataType::parse(nested("frozen<", 200000));
        FAIL() << "expected SpecificationError";
    } catch (const SpecificationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidDataType);
        EXPECT_NE(std::string(e.what()).find("nesting"), std::string::npos);
    }
}
