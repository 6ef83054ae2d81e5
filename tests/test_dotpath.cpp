/**
 * @file test_dotpath.cpp
 * @brief Unit tests for dot-path access (GoogleTest)
 */

#include <gtest/gtest.h>
#include "graft/DotPath.hpp"
#include "graft/Errors.hpp"

#include <optional>

using namespace graft;

// ============================================================================
// split_dot_path
// ============================================================================

TEST(SplitDotPath, Segments) {
    EXPECT_EQ(split_dot_path("database.host"), (std::vector<std::string>{"database", "host"}));
    EXPECT_EQ(split_dot_path("single"), (std::vector<std::string>{"single"}));
    EXPECT_TRUE(split_dot_path("").empty());
}

TEST(SplitDotPath, EmptyPiecesDropped) {
    EXPECT_EQ(split_dot_path(".a..b."), (std::vector<std::string>{"a", "b"}));
}

// ============================================================================
// get_by_dot
// ============================================================================

class GetByDotTest : public ::testing::Test {
protected:
    Node data = Node::map({
        {"simple", "value"},
        {"nested", Node::map({{"key", 42}, {"deep", Node::map({{"path", true}})}})},
        {"array", Node::list({1, 2, 3})},
        {"items", Node::list({
            Node::map({{"id", 1}, {"name", "first"}}),
            Node::map({{"id", 2}, {"name", "second"}}),
        })},
    });
};

TEST_F(GetByDotTest, SimpleKey) {
    EXPECT_EQ(*get_by_dot(data, "simple"), Node("value"));
}

TEST_F(GetByDotTest, DeeplyNested) {
    EXPECT_EQ(*get_by_dot(data, "nested.key"), Node(42));
    EXPECT_EQ(*get_by_dot(data, "nested.deep.path"), Node(true));
}

TEST_F(GetByDotTest, EmptyPathReturnsRoot) {
    EXPECT_EQ(get_by_dot(data, ""), &data);
}

TEST_F(GetByDotTest, ListIndex) {
    EXPECT_EQ(*get_by_dot(data, "array.1"), Node(2));
    EXPECT_EQ(*get_by_dot(data, "items.1.name"), Node("second"));
}

TEST(ParseListIndex, AcceptsPlainDecimal) {
    EXPECT_EQ(parse_list_index("0"), std::optional<std::size_t>(0));
    EXPECT_EQ(parse_list_index("12"), std::optional<std::size_t>(12));
    EXPECT_FALSE(parse_list_index(""));
    EXPECT_FALSE(parse_list_index("01"));
    EXPECT_FALSE(parse_list_index("-1"));
    EXPECT_FALSE(parse_list_index("1a"));
}

TEST(ParseListIndex, OverflowIsNotAnIndex) {
    EXPECT_FALSE(parse_list_index("99999999999999999999999"));
}

TEST_F(GetByDotTest, HugeIndexIsMissing) {
    EXPECT_THROW(get_by_dot(data, "array.99999999999999999999999"), KeyError);
    EXPECT_FALSE(contains_dot(data, "array.99999999999999999999999"));
}

TEST_F(GetByDotTest, MissingKeyRaisesKeyError) {
    EXPECT_THROW(get_by_dot(data, "missing"), KeyError);
    EXPECT_THROW(get_by_dot(data, "nested.port"), KeyError);
    EXPECT_THROW(get_by_dot(data, "array.10"), KeyError);
    EXPECT_THROW(get_by_dot(data, "array.01"), KeyError);
}

TEST_F(GetByDotTest, TraverseIntoScalarRaisesTypeMismatch) {
    EXPECT_THROW(get_by_dot(data, "simple.sub"), TypeMismatchError);
}

TEST_F(GetByDotTest, KeyErrorNamesSegment) {
    try {
        get_by_dot(data, "nested.missing");
        FAIL() << "Should have thrown KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.path(), "nested.missing");
        EXPECT_EQ(e.segment(), "missing");
    }
}

TEST_F(GetByDotTest, TypeMismatchNamesKinds) {
    try {
        get_by_dot(data, "nested.key.sub");
        FAIL() << "Should have thrown TypeMismatchError";
    } catch (const TypeMismatchError& e) {
        EXPECT_EQ(e.location(), "nested.key.sub");
        EXPECT_EQ(e.actual(), "integer");
    }
}

// ============================================================================
// set_by_dot
// ============================================================================

TEST(SetByDot, OverwritesExistingKey) {
    Node data = Node::map({{"server", Node::map({{"host", "localhost"}})}});
    set_by_dot(data, "server.host", "newhost", false);
    EXPECT_EQ(*get_by_dot(data, "server.host"), Node("newhost"));
}

TEST(SetByDot, WithoutCreateRaises) {
    Node data = Node::map({{"server", Node::map({{"host", "localhost"}})}, {"name", "v"}});
    EXPECT_THROW(set_by_dot(data, "db.port", 5432, false), KeyError);
    EXPECT_THROW(set_by_dot(data, "name.nested", "x", false), TypeMismatchError);
}

TEST(SetByDot, CreatesIntermediateMaps) {
    Node data = Node::map();
    set_by_dot(data, "level1.level2.value", "deep");
    EXPECT_TRUE(data.at("level1").is_map());
    EXPECT_EQ(data.at("level1").at("level2").at("value"), Node("deep"));
}

TEST(SetByDot, ReplacesScalarInTheWay) {
    Node data = Node::map({{"name", "scalar"}});
    set_by_dot(data, "name.nested", "value");
    EXPECT_EQ(*get_by_dot(data, "name.nested"), Node("value"));
}

TEST(SetByDot, KeepsSiblings) {
    Node data = Node::map({{"server", Node::map({{"host", "localhost"}, {"port", 8080}})}});
    set_by_dot(data, "server.timeout", 30);
    EXPECT_EQ(data.at("server"),
              Node::map({{"host", "localhost"}, {"port", 8080}, {"timeout", 30}}));
}

TEST(SetByDot, ListIndex) {
    Node data = Node::map({{"items", Node::list({1, 2})}});
    set_by_dot(data, "items.1", "two");
    EXPECT_EQ(data.at("items"), Node::list({1, "two"}));
    EXPECT_THROW(set_by_dot(data, "items.5", 0), KeyError);
    EXPECT_THROW(set_by_dot(data, "items.99999999999999999999999", 0), KeyError);
    EXPECT_THROW(set_by_dot(data, "items.01", 0), KeyError);
    EXPECT_EQ(data.at("items"), Node::list({1, "two"}));
}

TEST(SetByDot, EmptyPathReplacesRoot) {
    Node data = Node::map();
    set_by_dot(data, "", "replaced");
    EXPECT_EQ(data, Node("replaced"));
}

// ============================================================================
// contains_dot
// ============================================================================

TEST(ContainsDot, ExistingAndMissing) {
    Node data = Node::map({{"server", Node::map({{"host", "localhost"}})}, {"items", Node::list({1})}});
    EXPECT_TRUE(contains_dot(data, "server.host"));
    EXPECT_TRUE(contains_dot(data, "items.0"));
    EXPECT_TRUE(contains_dot(data, ""));
    EXPECT_FALSE(contains_dot(data, "server.port"));
    EXPECT_FALSE(contains_dot(data, "items.3"));
}

TEST(ContainsDot, ScalarTraversalRaises) {
    Node data = Node::map({{"count", 42}});
    EXPECT_THROW(contains_dot(data, "count.sub"), TypeMismatchError);
}
