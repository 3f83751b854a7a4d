#include <gtest/gtest.h>
#include "toml_json.hpp"

static Json::Value convert(std::string_view text) {
    toml::table table = toml::parse(text);
    return tomlToJson(table);
}

TEST(TomlJson, EmptyTableIsEmptyObject) {
    auto root = convert("");
    EXPECT_TRUE(root.isObject());
    EXPECT_TRUE(root.empty());
}

TEST(TomlJson, CredentialSection) {
    auto root = convert(
        "[ovh-eu]\n"
        "application_key = \"ak\"\n"
        "application_secret = 'as'\n"
        "consumer_key = \"\"\n");
    EXPECT_EQ(root["ovh-eu"]["application_key"].asString(), "ak");
    EXPECT_EQ(root["ovh-eu"]["application_secret"].asString(), "as");
    ASSERT_TRUE(root["ovh-eu"]["consumer_key"].isString());
    EXPECT_EQ(root["ovh-eu"]["consumer_key"].asString(), "");
}

TEST(TomlJson, ScalarTypes) {
    auto root = convert("a = 42\nb = -17\nc = 1_000\nd = 3.5\ne = true\n");
    EXPECT_TRUE(root["a"].isInt64());
    EXPECT_EQ(root["a"].asInt64(), 42);
    EXPECT_EQ(root["b"].asInt64(), -17);
    EXPECT_EQ(root["c"].asInt64(), 1000);
    EXPECT_DOUBLE_EQ(root["d"].asDouble(), 3.5);
    EXPECT_TRUE(root["e"].asBool());
}

TEST(TomlJson, NestedAndInlineTables) {
    auto root = convert(
        "owner = { name = \"ops\", team.id = 7 }\n"
        "[servers.alpha]\n"
        "site.name = \"rbx\"\n");
    EXPECT_EQ(root["owner"]["name"].asString(), "ops");
    EXPECT_EQ(root["owner"]["team"]["id"].asInt(), 7);
    EXPECT_EQ(root["servers"]["alpha"]["site"]["name"].asString(), "rbx");
}

TEST(TomlJson, MultiLineArrays) {
    auto root = convert("scopes = [\n  \"GET\",\n  \"POST\",\n]\nmixed = [[1, 2], [\"a\"]]\n");
    ASSERT_TRUE(root["scopes"].isArray());
    ASSERT_EQ(root["scopes"].size(), 2u);
    EXPECT_EQ(root["scopes"][1].asString(), "POST");
    EXPECT_EQ(root["mixed"][0][1].asInt(), 2);
    EXPECT_EQ(root["mixed"][1][0].asString(), "a");
}

TEST(TomlJson, DatesKeepTheirText) {
    auto root = convert("created = 2024-01-01\n");
    ASSERT_TRUE(root["created"].isString());
    EXPECT_EQ(root["created"].asString(), "2024-01-01");
}
