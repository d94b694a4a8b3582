// RangeCast - Seekable media delivery engine
// Tests for the JSON/YAML document model

#include <gtest/gtest.h>
#include "rangecast/core/json.hpp"

#include <string>

namespace rangecast {
namespace core {
namespace test {

// =============================================================================
// JSON
// =============================================================================

TEST(JsonTest, ParsesNestedDocument) {
    auto result = parseJson(R"({
        "version": 1,
        "name": "cache",
        "enabled": true,
        "entries": [ {"file": "1:2", "size": 1048576}, {"file": "1:3", "size": 12} ],
        "missing": null
    })");

    ASSERT_TRUE(result.isSuccess()) << result.error().toString();
    const JsonValue& doc = result.value();
    EXPECT_EQ(doc["version"].getInt(), 1);
    EXPECT_EQ(doc["name"].getString(), "cache");
    EXPECT_TRUE(doc["enabled"].getBool());
    EXPECT_TRUE(doc["missing"].isNull());
    ASSERT_TRUE(doc["entries"].isArray());
    ASSERT_EQ(doc["entries"].arrayValue.size(), 2u);
    EXPECT_EQ(doc["entries"].arrayValue[0]["size"].getUInt(), 1048576u);
    EXPECT_EQ(doc["entries"].arrayValue[1]["file"].getString(), "1:3");
}

TEST(JsonTest, MissingKeysFallBackToDefaults) {
    auto result = parseJson(R"({"a": "text"})");
    ASSERT_TRUE(result.isSuccess());

    EXPECT_EQ(result.value()["b"].getInt(7), 7);
    EXPECT_EQ(result.value()["a"].getInt(3), 3);
    EXPECT_EQ(result.value()["a"]["nested"].getString("none"), "none");
    EXPECT_FALSE(result.value().contains("b"));
}

TEST(JsonTest, DecodesEscapes) {
    auto result = parseJson(R"({"path": "a\\b \"q\" \nA"})");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value()["path"].getString(), "a\\b \"q\" \nA");
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_TRUE(parseJson("").isError());
    EXPECT_TRUE(parseJson("{").isError());
    EXPECT_TRUE(parseJson(R"({"a": 1,})").isError());
    EXPECT_TRUE(parseJson(R"({"a": 1} trailing)").isError());
    EXPECT_TRUE(parseJson(R"({"a": "unterminated)").isError());

    auto failure = parseJson("[1, 2");
    ASSERT_TRUE(failure.isError());
    EXPECT_EQ(failure.error().code, ErrorCode::ConfigInvalid);
}

TEST(JsonTest, EscapeProducesParseableString) {
    std::string raw = "quote\" slash\\ tab\t line\n";
    auto result = parseJson("{\"v\": \"" + escapeJson(raw) + "\"}");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value()["v"].getString(), raw);
}

// =============================================================================
// YAML
// =============================================================================

TEST(YamlTest, ParsesNestedMapsAndScalars) {
    auto result = parseYaml(
        "# server settings\n"
        "server:\n"
        "  port: 8080\n"
        "  bindAddress: \"127.0.0.1\"\n"
        "cache:\n"
        "  enabled: yes\n"
        "  directory: /var/cache/rangecast  # on local disk\n"
        "  ratio: 0.5\n"
        "sessions:\n"
        "  labels: [alpha, beta, gamma]\n");

    ASSERT_TRUE(result.isSuccess()) << result.error().toString();
    const JsonValue& doc = result.value();
    EXPECT_EQ(doc["server"]["port"].getInt(), 8080);
    EXPECT_EQ(doc["server"]["bindAddress"].getString(), "127.0.0.1");
    EXPECT_TRUE(doc["cache"]["enabled"].getBool());
    EXPECT_EQ(doc["cache"]["directory"].getString(), "/var/cache/rangecast");
    EXPECT_DOUBLE_EQ(doc["cache"]["ratio"].getDouble(), 0.5);

    const JsonValue& labels = doc["sessions"]["labels"];
    ASSERT_TRUE(labels.isArray());
    ASSERT_EQ(labels.arrayValue.size(), 3u);
    EXPECT_EQ(labels.arrayValue[2].getString(), "gamma");
}

TEST(YamlTest, RejectsLineWithoutKey) {
    auto result = parseYaml("server:\n  just a value\n");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.error().message.find("line 2"), std::string::npos);
}

} // namespace test
} // namespace core
} // namespace rangecast
