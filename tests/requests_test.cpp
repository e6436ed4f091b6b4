#include <chatgate/gateway/requests.hpp>

#include <gtest/gtest.h>

using namespace chatgate;

TEST(RequestsTest, EmptyBodyIsEmptyObject) {
    Json j = parse_body("  ");
    EXPECT_TRUE(j.is_object());
    EXPECT_TRUE(j.empty());
}

TEST(RequestsTest, MalformedBodyIsInvalidJson) {
    try {
        parse_body("{\"to\":");
        FAIL() << "malformed body must throw";
    } catch (const GatewayError& e) {
        EXPECT_EQ(ErrorKind::VALIDATION, e.kind());
        EXPECT_EQ("invalid_json", e.code());
    }
    EXPECT_THROW(parse_body("\"just a string\""), GatewayError);
}

TEST(RequestsTest, WaitAckIsClamped) {
    EXPECT_EQ(0, parse_wait_ack(Json::parse("{}")));
    EXPECT_EQ(8000, parse_wait_ack(Json::parse("{\"waitAckMs\":8000}")));
    EXPECT_EQ(5000, parse_wait_ack(Json::parse("{\"waitAckMs\":\"5000\"}")));
    EXPECT_EQ(0, parse_wait_ack(Json::parse("{\"waitAckMs\":-3}")));
    EXPECT_EQ(WAIT_ACK_MAX_MS, parse_wait_ack(Json::parse("{\"waitAckMs\":999999999}")));
}

TEST(RequestsTest, ButtonsAcceptObjectsOrStrings) {
    ButtonsMessage m = parse_buttons_message(Json::parse(
        "{\"text\":\"Pick\",\"footer\":\"f\",\"buttons\":[{\"id\":\"a\",\"title\":\"A\"},"
        "{\"id\":\"b\",\"text\":\"B\"},\"C\"]}"));
    EXPECT_EQ("Pick", m.text);
    EXPECT_EQ("f", m.footer);
    ASSERT_EQ(3u, m.buttons.size());
    EXPECT_EQ("B", m.buttons[1].title);
    EXPECT_EQ("btn_3", m.buttons[2].id);
    EXPECT_EQ("C", m.buttons[2].title);
}

TEST(RequestsTest, ListSectionsAcceptRowsOrOptions) {
    ListMessage m = parse_list_message(Json::parse(
        "{\"text\":\"Menu\",\"buttonText\":\"Open\",\"sections\":["
        "{\"title\":\"S1\",\"rows\":[{\"id\":\"r1\",\"title\":\"Row 1\",\"description\":\"d\"}]},"
        "{\"title\":\"S2\",\"options\":[{\"id\":\"o1\",\"title\":\"Opt\"}]}]}"));
    EXPECT_EQ("Open", m.button_text);
    ASSERT_EQ(2u, m.sections.size());
    ASSERT_EQ(1u, m.sections[0].options.size());
    EXPECT_EQ("d", m.sections[0].options[0].description);
    EXPECT_EQ("o1", m.sections[1].options[0].id);
}

TEST(RequestsTest, MediaFieldAliases) {
    MediaMessage m = parse_media_message(Json::parse(
        "{\"type\":\"AUDIO\",\"url\":\"https://x/y.ogg\",\"mimeType\":\"audio/ogg\",\"ptt\":\"yes\"}"));
    EXPECT_EQ("audio", m.type);
    EXPECT_EQ("audio/ogg", m.mimetype);
    EXPECT_TRUE(m.ptt);
    EXPECT_FALSE(m.gif_playback);

    MediaMessage d = parse_media_message(Json::parse(
        "{\"mediaType\":\"document\",\"base64\":\"QUJD\",\"fileName\":\"a.pdf\",\"type\":\"image\"}"));
    EXPECT_EQ("document", d.type);
    EXPECT_EQ("a.pdf", d.file_name);
}

TEST(RequestsTest, PollKeepsOnlyStringOptions) {
    PollMessage p = parse_poll_message(Json::parse(
        "{\"name\":\"Lunch?\",\"options\":[\"yes\",3,\"no\"],\"selectableCount\":2}"));
    EXPECT_EQ("Lunch?", p.question);
    ASSERT_EQ(2u, p.options.size());
    EXPECT_EQ("no", p.options[1]);
    EXPECT_EQ(2, p.selectable_count);

    EXPECT_EQ(1, parse_poll_message(Json::parse("{}")).selectable_count);
}

TEST(RequestsTest, PatchRequestTypes) {
    PatchRequest r = parse_patch_request(Json::parse("{\"note\":\"n\",\"author\":\"ops\"}"));
    EXPECT_FALSE(r.has_name);
    EXPECT_TRUE(r.has_note);
    EXPECT_EQ("ops", r.author);

    EXPECT_FALSE(parse_patch_request(Json::parse("{\"name\":null}")).has_name);

    try {
        parse_patch_request(Json::parse("{\"name\":42}"));
        FAIL() << "numeric name must throw";
    } catch (const GatewayError& e) {
        EXPECT_EQ("name_invalid", e.code());
    }
    EXPECT_THROW(parse_patch_request(Json::parse("{\"note\":[]}")), GatewayError);
}

TEST(RequestsTest, Flags) {
    EXPECT_TRUE(parse_flag(nullptr, true));
    EXPECT_FALSE(parse_flag("false", true));
    EXPECT_FALSE(parse_flag("OFF", true));
    EXPECT_FALSE(parse_flag("0", true));
    EXPECT_TRUE(parse_flag("1", false));
    EXPECT_TRUE(parse_flag("", true));
}

TEST(RequestsTest, IdList) {
    std::vector<std::string> ids = parse_id_list(Json::parse("{\"ids\":[\"a\",\"\",7,\"b\"]}"));
    ASSERT_EQ(2u, ids.size());
    EXPECT_EQ("b", ids[1]);
    EXPECT_THROW(parse_id_list(Json::parse("{\"ids\":[]}")), GatewayError);
    EXPECT_THROW(parse_id_list(Json::parse("{}")), GatewayError);
}

TEST(RequestsTest, LimitIsClamped) {
    EXPECT_EQ(50, parse_limit(nullptr, 50));
    EXPECT_EQ(1, parse_limit("0", 50));
    EXPECT_EQ(200, parse_limit("5000", 50));
    EXPECT_EQ(25, parse_limit("25", 50));
}

TEST(RequestsTest, ApiKeys) {
    std::vector<std::string> none;
    EXPECT_TRUE(api_key_allowed(none, ""));

    std::vector<std::string> keys;
    keys.push_back("k1");
    keys.push_back("k2");
    EXPECT_TRUE(api_key_allowed(keys, "k2"));
    EXPECT_FALSE(api_key_allowed(keys, ""));
    EXPECT_FALSE(api_key_allowed(keys, "k3"));
}

TEST(RequestsTest, ErrorBodyShape) {
    Json j = error_body("rate_limit_exceeded", "retry after 14500 ms");
    EXPECT_EQ("rate_limit_exceeded", j["error"].as_string());
    EXPECT_EQ("retry after 14500 ms", j["detail"].as_string());
}
