/**
 * @file test_env_mapper.cpp
 * @brief Tests for environment variable mapping
 */

#include <gtest/gtest.h>
#include "graft/EnvMapper.hpp"
#include "graft/Config.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace graft;
using graft::test::ScopedEnvVar;

// ============================================================================
// Name transformation
// ============================================================================

TEST(TransformEnvName, UnderscoresBecomeDots) {
    EXPECT_EQ(transform_env_name("MERGE_STRICT"), "merge.strict");
    EXPECT_EQ(transform_env_name("XML_ROOT"), "xml.root");
    EXPECT_EQ(transform_env_name("LEVEL"), "level");
}

TEST(TransformEnvName, DoubleUnderscoreIsLiteral) {
    EXPECT_EQ(transform_env_name("LOG__LEVEL"), "log_level");
    EXPECT_EQ(transform_env_name("A__B_C"), "a_b.c");
}

TEST(StripPrefix, CaseInsensitive) {
    EXPECT_EQ(strip_prefix("GRAFT_LOG_LEVEL", "GRAFT"), "LOG_LEVEL");
    EXPECT_EQ(strip_prefix("graft_log_level", "GRAFT"), "log_level");
    EXPECT_EQ(strip_prefix("GRAFT_LOG_LEVEL", "GRAFT_"), "LOG_LEVEL");
}

TEST(StripPrefix, NoMatch) {
    EXPECT_EQ(strip_prefix("OTHER_LOG_LEVEL", "GRAFT"), "");
    EXPECT_EQ(strip_prefix("GRAFTLOG", "GRAFT"), "");
}

// ============================================================================
// Known keys
// ============================================================================

TEST(FlattenKeys, IncludesContainers) {
    auto keys = flatten_keys(Config::defaults());
    const std::set<std::string> expected{
        "output_format", "log_level", "merge", "merge.duplicates", "merge.strict",
        "xml", "xml.root",
    };
    EXPECT_EQ(keys, expected);
}

TEST(FlattenKeys, ScalarRoot) {
    EXPECT_TRUE(flatten_keys(Node(1)).empty());
}

TEST(RemapEnvKey, ExactAndRejoined) {
    const auto known = flatten_keys(Config::defaults());
    EXPECT_EQ(remap_env_key("merge.strict", known), "merge.strict");
    EXPECT_EQ(remap_env_key("output.format", known), "output_format");
    EXPECT_EQ(remap_env_key("log.level", known), "log_level");
    EXPECT_EQ(remap_env_key("merge.nothing", known), "");
    EXPECT_EQ(remap_env_key("unknown", known), "");
}

// ============================================================================
// Pipeline
// ============================================================================

TEST(MapEnvVars, TypesValuesAndDropsUnknown) {
    auto mapped = map_env_vars({
        {"GRAFT_MERGE_STRICT", "true"},
        {"GRAFT_OUTPUT_FORMAT", "yaml"},
        {"GRAFT_MERGE", "x"},
        {"GRAFT_COLOR", "red"},
        {"OTHER_LOG_LEVEL", "debug"},
    }, "GRAFT", Config::defaults());

    ASSERT_EQ(mapped.size(), 2u);
    EXPECT_EQ(mapped[0].first, "merge.strict");
    EXPECT_EQ(mapped[0].second, Node(true));
    EXPECT_EQ(mapped[1].first, "output_format");
    EXPECT_EQ(mapped[1].second, Node("yaml"));
}

TEST(CollectEnvVars, FiltersByPrefix) {
    ScopedEnvVar a("GRAFTTEST_XML_ROOT", "doc");
    ScopedEnvVar b("GRAFTTESTING_XML_ROOT", "other");

    auto vars = collect_env_vars("GRAFTTEST");
    auto it = std::find_if(vars.begin(), vars.end(),
                           [](const auto& kv) { return kv.first == "GRAFTTEST_XML_ROOT"; });
    ASSERT_NE(it, vars.end());
    EXPECT_EQ(it->second, "doc");

    for (const auto& [name, value] : vars) {
        EXPECT_NE(name, "GRAFTTESTING_XML_ROOT") << value;
    }
}

TEST(CollectEnvVars, EmptyPrefixCollectsNothing) {
    EXPECT_TRUE(collect_env_vars("").empty());
}
