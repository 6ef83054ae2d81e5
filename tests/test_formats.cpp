/**
 * @file test_formats.cpp
 * @brief Tests for the format collaborators
 *
 * Every format must turn equivalent documents into the same tree, so
 * the merge engine never needs to know where a tree came from.
 */

#include <gtest/gtest.h>
#include "graft/Errors.hpp"
#include "graft/Format.hpp"
#include "test_helpers.hpp"

using namespace graft;

namespace {

Node scenario_base() {
    return Node::map({{"environment", Node::map({{"preview", Node::list({
        Node::map({{"name", "url"}, {"value", "preview.com"}}),
        Node::map({{"name", "allowedIps"}, {"value", Node::list()}}),
    })}})}});
}

Node parse_as(const std::string& format, const std::string& text) {
    return make_format(format)->parse(text);
}

Node round_trip(const std::string& format, const Node& tree) {
    auto fmt = make_format(format);
    return fmt->parse(fmt->serialize(tree));
}

} // namespace

// ============================================================================
// Same tree from every format
// ============================================================================

TEST(Formats, EquivalentDocumentsGiveSameTree) {
    const std::string json = R"({
        "environment": {"preview": [
            {"name": "url", "value": "preview.com"},
            {"name": "allowedIps", "value": []}
        ]}
    })";
    const std::string yaml =
        "environment:\n"
        "  preview:\n"
        "    - name: url\n"
        "      value: preview.com\n"
        "    - name: allowedIps\n"
        "      value: []\n";
    const std::string toml =
        "[[environment.preview]]\n"
        "name = \"url\"\n"
        "value = \"preview.com\"\n"
        "\n"
        "[[environment.preview]]\n"
        "name = \"allowedIps\"\n"
        "value = []\n";
    const std::string rune =
        "#!RUNE\n"
        "@environment\n"
        "preview:\n"
        "  - {name = url, value = preview.com}\n"
        "  - {name = allowedIps, value = ()}\n";

    EXPECT_EQ(parse_as("json", json), scenario_base());
    EXPECT_EQ(parse_as("yaml", yaml), scenario_base());
    EXPECT_EQ(parse_as("toml", toml), scenario_base());
    EXPECT_EQ(parse_as("rune", rune), scenario_base());
}

TEST(Formats, RoundTripThroughEveryFormat) {
    const Node tree = Node::map({
        {"service", Node::map({
            {"name", "api"},
            {"port", 8080},
            {"ratio", 0.75},
            {"enabled", true},
            {"tags", Node::list({"blue", "green"})},
        })},
    });
    for (const auto& name : format_names()) {
        EXPECT_EQ(round_trip(name, tree), tree) << name;
    }
}

TEST(Formats, UnknownFormatName) {
    EXPECT_THROW(make_format("ini"), UnsupportedFormatError);
    EXPECT_EQ(make_format("YAML")->name(), "yaml");
    EXPECT_EQ(make_format("yml")->name(), "yaml");
}

TEST(Formats, NameForPath) {
    EXPECT_EQ(format_name_for_path("base.json"), "json");
    EXPECT_EQ(format_name_for_path("conf/values.YML"), "yaml");
    EXPECT_EQ(format_name_for_path("pom.xml"), "xml");
    EXPECT_EQ(format_name_for_path("Cargo.toml"), "toml");
    EXPECT_EQ(format_name_for_path("app.rune"), "rune");
    EXPECT_EQ(format_name_for_path("settings"), "rune");
    EXPECT_EQ(format_name_for_path("settings.ini", "json"), "json");
}

// ============================================================================
// JSON
// ============================================================================

TEST(JsonFormat, KeepsKeyOrderOnOutput) {
    Node tree = make_format("json")->parse(R"({"zeta": 1, "alpha": {"b": 2, "a": 3}})");
    EXPECT_EQ(JsonFormat(-1).serialize(tree), R"({"zeta":1,"alpha":{"b":2,"a":3}})");
}

TEST(JsonFormat, Indent) {
    EXPECT_EQ(JsonFormat(2).serialize(Node::map({{"a", 1}})), "{\n  \"a\": 1\n}");
}

TEST(JsonFormat, ParseError) {
    EXPECT_THROW(parse_as("json", "{\"a\": "), FormatParseError);
    try {
        parse_as("json", "[1, 2");
        FAIL() << "expected FormatParseError";
    } catch (const FormatParseError& e) {
        EXPECT_EQ(e.format(), "json");
    }
}

// ============================================================================
// YAML
// ============================================================================

TEST(YamlFormat, PlainScalarsAreTyped) {
    Node tree = parse_as("yaml",
                         "port: 8080\n"
                         "ratio: 0.5\n"
                         "on: true\n"
                         "tilde: ~\n"
                         "empty:\n"
                         "ip: 12.12.12.10\n");
    EXPECT_EQ(tree.at("port"), Node(8080));
    EXPECT_EQ(tree.at("ratio"), Node(0.5));
    EXPECT_EQ(tree.at("on"), Node(true));
    EXPECT_TRUE(tree.at("tilde").is_null());
    EXPECT_TRUE(tree.at("empty").is_null());
    EXPECT_EQ(tree.at("ip"), Node("12.12.12.10"));
}

TEST(YamlFormat, QuotedScalarsStayStrings) {
    Node tree = parse_as("yaml", "a: \"true\"\nb: '42'\nc: \"\"\n");
    EXPECT_EQ(tree.at("a"), Node("true"));
    EXPECT_EQ(tree.at("b"), Node("42"));
    EXPECT_EQ(tree.at("c"), Node(""));
}

TEST(YamlFormat, StringsThatLookTypedSurviveRoundTrip) {
    const Node tree = Node::map({
        {"version", "1.0"},
        {"flag", "false"},
        {"nothing", "null"},
        {"tilde", "~"},
        {"blank", ""},
        {"real_null", nullptr},
        {"whole", 2.0},
        {"empty_list", Node::list()},
        {"empty_map", Node::map()},
    });
    Node back = round_trip("yaml", tree);
    EXPECT_EQ(back, tree);
    EXPECT_TRUE(back.at("whole").scalar().is_float());
}

TEST(YamlFormat, ParseError) {
    EXPECT_THROW(parse_as("yaml", "a: [1, 2\n"), FormatParseError);
}

// ============================================================================
// TOML
// ============================================================================

TEST(TomlFormat, DatesBecomeStrings) {
    Node tree = parse_as("toml", "day = 1979-05-27\nat = 07:32:00\n");
    EXPECT_EQ(tree.at("day"), Node("1979-05-27"));
    EXPECT_TRUE(tree.at("at").scalar().is_string());
}

TEST(TomlFormat, NestedTablesAndArraysOfTables) {
    Node tree = parse_as("toml",
                         "[db]\n"
                         "host = \"localhost\"\n"
                         "ports = [5432, 5433]\n"
                         "[[db.replica]]\n"
                         "host = \"r1\"\n");
    EXPECT_EQ(tree.at("db").at("ports"), Node::list({5432, 5433}));
    EXPECT_EQ(tree.at("db").at("replica").at(0).at("host"), Node("r1"));
}

TEST(TomlFormat, NullWrittenAsEmptyString) {
    Node back = round_trip("toml", Node::map({{"missing", nullptr}}));
    EXPECT_EQ(back.at("missing"), Node(""));
}

TEST(TomlFormat, NonMapRootWrittenUnderValue) {
    Node back = round_trip("toml", Node::list({1, 2}));
    EXPECT_EQ(back, Node::map({{"value", Node::list({1, 2})}}));
}

TEST(TomlFormat, ParseErrorHasPosition) {
    try {
        parse_as("toml", "a = 1\nb = \n");
        FAIL() << "expected FormatParseError";
    } catch (const FormatParseError& e) {
        EXPECT_EQ(e.format(), "toml");
        EXPECT_NE(e.details().find("line 2"), std::string::npos) << e.details();
    }
}

// ============================================================================
// XML
// ============================================================================

TEST(XmlFormat, ElementsAttributesAndText) {
    Node tree = parse_as("xml",
                         "<?xml version=\"1.0\"?>\n"
                         "<config version=\"2\">\n"
                         "  <host> api.example.com </host>\n"
                         "  <port>8080</port>\n"
                         "  <debug>false</debug>\n"
                         "  <note lang=\"en\">hello<b>x</b></note>\n"
                         "  <empty/>\n"
                         "  <!-- ignored -->\n"
                         "</config>\n");
    EXPECT_EQ(tree.at("@version"), Node(2));
    EXPECT_EQ(tree.at("host"), Node("api.example.com"));
    EXPECT_EQ(tree.at("port"), Node(8080));
    EXPECT_EQ(tree.at("debug"), Node(false));
    EXPECT_EQ(tree.at("note"), Node::map({{"@lang", "en"}, {"b", "x"}, {"#text", "hello"}}));
    EXPECT_TRUE(tree.at("empty").is_null());
}

TEST(XmlFormat, RepeatedElementsBecomeList) {
    Node tree = parse_as("xml",
                         "<root><environment>"
                         "<preview><name>url</name><value>preview.com</value></preview>"
                         "<preview><name>allowedIps</name><value/></preview>"
                         "</environment></root>");
    const Node& preview = tree.at("environment").at("preview");
    ASSERT_TRUE(preview.is_list());
    EXPECT_EQ(preview.at(0).at("value"), Node("preview.com"));
    EXPECT_TRUE(preview.at(1).at("value").is_null());
}

TEST(XmlFormat, SingleElementListReadsBackAsScalar) {
    Node back = round_trip("xml", Node::map({{"port", Node::list({80})}}));
    EXPECT_EQ(back.at("port"), Node(80));
}

TEST(XmlFormat, EmptyRootIsEmptyMap) {
    Node tree = parse_as("xml", "<root/>");
    EXPECT_TRUE(tree.is_map());
    EXPECT_EQ(tree.size(), 0u);
}

TEST(XmlFormat, WritesRootNameAndAttributes) {
    XmlFormat fmt("config");
    const Node tree = Node::map({{"@version", 2}, {"name", "svc"}, {"ports", Node::list({80, 443})}});
    const std::string text = fmt.serialize(tree);
    EXPECT_NE(text.find("<config version=\"2\">"), std::string::npos) << text;
    EXPECT_EQ(fmt.parse(text), tree);
}

TEST(XmlFormat, TopLevelListUsesItemElements) {
    Node back = round_trip("xml", Node::list({"a", "b"}));
    EXPECT_EQ(back, Node::map({{"item", Node::list({"a", "b"})}}));
}

TEST(XmlFormat, InvalidNamesRejected) {
    EXPECT_THROW(XmlFormat().serialize(Node::map({{"bad name", 1}})), GraftError);
    EXPECT_THROW(XmlFormat("1root").serialize(Node::map()), GraftError);
}

TEST(XmlFormat, ParseError) {
    EXPECT_THROW(parse_as("xml", "<root><a></root>"), FormatParseError);
    EXPECT_THROW(parse_as("xml", ""), FormatParseError);
}

// ============================================================================
// Rune
// ============================================================================

TEST(RuneFormat, SectionsEntriesAndRecords) {
    Node tree = parse_as("rune",
                         "#!RUNE\n"
                         "# deployment targets\n"
                         "@environment/preview\n"
                         "region = eu-west\n"
                         "replicas = 3\n"
                         "label = \"42\"\n"
                         "+ name = url\n"
                         "  value = preview.com\n"
                         "+ name = allowedIps\n"
                         "  value = (10.0.0.1 10.0.0.2)\n");
    const Node& preview = tree.at("environment").at("preview");
    EXPECT_EQ(preview.at("region"), Node("eu-west"));
    EXPECT_EQ(preview.at("replicas"), Node(3));
    EXPECT_EQ(preview.at("label"), Node("42"));
    ASSERT_EQ(preview.at("record").size(), 2u);
    EXPECT_EQ(preview.at("record").at(1),
              Node::map({{"name", "allowedIps"}, {"value", Node::list({"10.0.0.1", "10.0.0.2"})}}));
}

TEST(RuneFormat, SeriesBlocksAndMultiline) {
    Node tree = parse_as("rune",
                         "@app\n"
                         "hosts:\n"
                         "  - a.local\n"
                         "  - {name = b.local, port = 81}\n"
                         "  backup:\n"
                         "    - c.local\n"
                         "  - d.local\n"
                         "pool {\n"
                         "  min = 1\n"
                         "  max = 10\n"
                         "}\n"
                         "motd >\n"
                         "  first line\n"
                         "  second line\n"
                         "\n"
                         "after = true\n");
    const Node& app = tree.at("app");
    EXPECT_EQ(app.at("hosts"), Node::list({
        "a.local",
        Node::map({{"name", "b.local"}, {"port", 81}}),
        Node::map({{"backup", Node::list({"c.local"})}}),
        "d.local",
    }));
    EXPECT_EQ(app.at("pool"), Node::map({{"min", 1}, {"max", 10}}));
    EXPECT_EQ(app.at("motd"), Node("first line\nsecond line"));
    EXPECT_EQ(app.at("after"), Node(true));
}

TEST(RuneFormat, EnvironmentReferences) {
    test::ScopedEnvVar env("GRAFT_TEST_RUNE_HOST", "db.internal");
    Node tree = parse_as("rune", "@db\nhost = $GRAFT_TEST_RUNE_HOST$\n");
    EXPECT_EQ(tree.at("db").at("host"), Node("db.internal"));
}

TEST(RuneFormat, RoundTrip) {
    const Node tree = Node::map({
        {"environment", Node::map({
            {"preview", Node::map({
                {"region", "eu west"},
                {"ips", Node::list({"10.0.0.1", Node::map({{"nested", Node::list({"x"})}})})},
                {"record", Node::list({
                    Node::map({{"name", "url"}, {"value", "preview.com"}}),
                    Node::map({{"name", "allowedIps"}, {"value", Node::list({"1.1.1.1"})},
                               {"limits", Node::map({{"max", 5}})}}),
                })},
            })},
            {"empty", Node::map()},
        })},
        {"notes", Node::map({{"motd", "line one\nline two"}, {"ratio", 2.0}, {"none", nullptr}})},
    });
    EXPECT_EQ(round_trip("rune", tree), tree);
}

TEST(RuneFormat, UnwritableTrees) {
    RuneFormat fmt;
    EXPECT_THROW(fmt.serialize(Node::list({1})), GraftError);
    EXPECT_THROW(fmt.serialize(Node::map({{"top", 1}})), GraftError);
    EXPECT_THROW(fmt.serialize(Node::map({{"s", Node::map({{"a=b", 1}})}})), GraftError);
    EXPECT_THROW(fmt.serialize(Node::map({{"s", Node::map({{"l", Node::list({Node::list()})}})}})),
                 GraftError);
}

TEST(RuneFormat, ParseErrorsNameTheLine) {
    try {
        parse_as("rune", "#!RUNE\nkey = 1\n");
        FAIL() << "expected FormatParseError";
    } catch (const FormatParseError& e) {
        EXPECT_EQ(e.format(), "rune");
        EXPECT_NE(e.details().find("line 2"), std::string::npos) << e.details();
    }
    EXPECT_THROW(parse_as("rune", "@a//b\n"), FormatParseError);
    EXPECT_THROW(parse_as("rune", "@a\nblock {\n  x = 1\n"), FormatParseError);
    EXPECT_THROW(parse_as("rune", "@a\njust words\n"), FormatParseError);
}
