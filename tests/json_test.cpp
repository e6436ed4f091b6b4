#include <chatgate/core/json.hpp>
#include <chatgate/core/config.hpp>
#include <chatgate/core/utils.hpp>

#include <gtest/gtest.h>
#include <cstdlib>

using namespace chatgate;

// ============ Json ============

TEST(JsonTest, ParsesNestedDocument) {
    Json j = Json::parse("{\"a\":[1,2,{\"b\":\"x\"}],\"ok\":true,\"n\":null}");
    ASSERT_TRUE(j.is_object());
    ASSERT_TRUE(j["a"].is_array());
    EXPECT_EQ(3u, j["a"].size());
    EXPECT_EQ(2, j["a"].as_array()[1].as_int());
    EXPECT_EQ("x", j["a"].as_array()[2]["b"].as_string());
    EXPECT_TRUE(j["ok"].as_bool());
    EXPECT_TRUE(j["n"].is_null());
}

TEST(JsonTest, KeepsLargeIntegersExact) {
    int64_t ts = 1700000000123LL;
    Json j = Json::object();
    j["ts"] = ts;
    Json back = Json::parse(j.dump());
    EXPECT_TRUE(back["ts"].is_integer());
    EXPECT_EQ(ts, back["ts"].as_int());
}

TEST(JsonTest, ValueFallsBackOnMissingOrMistyped) {
    Json j = Json::parse("{\"s\":\"str\",\"i\":5}");
    EXPECT_EQ("str", j.value("s", std::string("def")));
    EXPECT_EQ("def", j.value("i", std::string("def")));
    EXPECT_EQ(5, j.value("i", 0));
    EXPECT_EQ(7, j.value("missing", 7));
    EXPECT_FALSE(j.value("s", false));
}

TEST(JsonTest, MissingKeysReadAsNullWithoutInserting) {
    const Json j = Json::parse("{\"a\":1}");
    EXPECT_TRUE(j["nope"].is_null());
    EXPECT_TRUE(j["nope"]["deeper"].is_null());
    EXPECT_EQ(1u, j.size());
}

TEST(JsonTest, EscapesAndUnicodeSurviveDump) {
    Json j = Json::object();
    j["text"] = std::string("line\n\"quoted\" caf\xc3\xa9");
    Json back = Json::parse(j.dump());
    EXPECT_EQ(j["text"].as_string(), back["text"].as_string());

    Json u = Json::parse("\"\\u00e9\\ud83d\\ude00\"");
    EXPECT_EQ("\xc3\xa9\xf0\x9f\x98\x80", u.as_string());
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Json::parse("{\"a\":"), JsonParseError);
    EXPECT_THROW(Json::parse("[1,2"), JsonParseError);
    EXPECT_THROW(Json::parse("{} trailing"), JsonParseError);
    EXPECT_THROW(Json::parse(""), JsonParseError);
}

TEST(JsonTest, ObjectKeysDumpInSortedOrder) {
    Json j = Json::object();
    j["b"] = 2;
    j["a"] = 1;
    EXPECT_EQ("{\"a\":1,\"b\":2}", j.dump());
}

// ============ Config ============

TEST(ConfigTest, DotKeysReadNestedValues) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"gateway\":{\"port\":9000,\"bind\":\"0.0.0.0\"},"
                                "\"webhook\":{\"secret\":\"s\"},\"flag\":true}"));
    EXPECT_EQ(9000, cfg.get_int("gateway.port", 1));
    EXPECT_EQ("0.0.0.0", cfg.get_string("gateway.bind"));
    EXPECT_EQ("s", cfg.get_string("webhook.secret"));
    EXPECT_TRUE(cfg.get_bool("flag"));
    EXPECT_EQ(42, cfg.get_int("missing.key", 42));
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"rate\":{\"max_sends\":20}}"));
    EXPECT_EQ("CHATGATE_RATE_MAX_SENDS", Config::to_env_key("rate.max_sends"));

    setenv("CHATGATE_RATE_MAX_SENDS", "5", 1);
    EXPECT_EQ(5, cfg.get_int("rate.max_sends", 0));
    unsetenv("CHATGATE_RATE_MAX_SENDS");
    EXPECT_EQ(20, cfg.get_int("rate.max_sends", 0));
}

TEST(ConfigTest, StringListFromArrayOrCommaString) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"gateway\":{\"api_keys\":[\"k1\",\"k2\"]},\"other\":\"a, b\"}"));
    std::vector<std::string> keys = cfg.get_string_list("gateway.api_keys");
    ASSERT_EQ(2u, keys.size());
    EXPECT_EQ("k2", keys[1]);

    std::vector<std::string> other = cfg.get_string_list("other");
    ASSERT_EQ(2u, other.size());
    EXPECT_EQ("b", other[1]);
}

TEST(ConfigTest, BadFileIsReported) {
    Config cfg;
    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.last_error().empty());
}

// ============ Utils ============

TEST(UtilsTest, SlugifyCollapsesSeparators) {
    EXPECT_EQ("sales-team-1", slugify("  Sales Team #1 "));
    EXPECT_EQ("a-b", slugify("a---b"));
    EXPECT_EQ("", slugify("!!!"));
}

TEST(UtilsTest, NormalizeRecipient) {
    EXPECT_EQ("5511999998888", normalize_recipient("+55 (11) 99999-8888"));
    EXPECT_EQ("12036304@g.us", normalize_recipient("12036304@g.us"));
    EXPECT_EQ("", normalize_recipient("12345"));
    EXPECT_EQ("", normalize_recipient("@s.whatsapp.net"));
}

TEST(UtilsTest, TruncateSafeKeepsUtf8Whole) {
    std::string s = "ab\xc3\xa9";     // 4 bytes, 3 characters
    EXPECT_EQ("ab", truncate_safe(s, 3));
    EXPECT_EQ(s, truncate_safe(s, 4));
}

TEST(UtilsTest, Base64DecodedSize) {
    EXPECT_EQ(3, base64_decoded_size("QUJD"));
    EXPECT_EQ(2, base64_decoded_size("QUI="));
    EXPECT_EQ(3, base64_decoded_size("data:text/plain;base64,QUJD"));
    EXPECT_EQ(-1, base64_decoded_size("QU*D"));
}

TEST(UtilsTest, ConstantTimeEquals) {
    EXPECT_TRUE(constant_time_equals("secret", "secret"));
    EXPECT_FALSE(constant_time_equals("secret", "secreT"));
    EXPECT_FALSE(constant_time_equals("secret", "secret2"));
}

TEST(UtilsTest, GeneratedUuidsAreDistinct) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    EXPECT_EQ(36u, a.size());
    EXPECT_NE(a, b);
}
