#include <chatgate/core/options.hpp>

#include <gtest/gtest.h>

using namespace chatgate;

TEST(OptionsTest, DefaultsAreUsable) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{}"));
    GatewayOptions o = GatewayOptions::from_config(cfg);

    EXPECT_EQ("", o.validate());
    EXPECT_EQ(20, o.registry.session.rate_max_sends);
    EXPECT_EQ(15000, o.registry.session.rate_window_ms);
    EXPECT_EQ(1000, o.registry.session.connection.reconnect_min_ms);
    EXPECT_EQ(30000, o.registry.session.connection.reconnect_max_ms);
    EXPECT_EQ(60000, o.registry.session.connection.qr_initial_ttl_ms);
    EXPECT_EQ(20000, o.registry.session.connection.qr_subsequent_ttl_ms);
    EXPECT_EQ(10 * 60 * 1000, o.registry.session.ledger.ttl_ms);
    EXPECT_EQ(8080, o.port);
    EXPECT_EQ("127.0.0.1", o.bind);
    EXPECT_EQ("sessions/sessions.db", o.database);
    EXPECT_TRUE(o.api_keys.empty());
    EXPECT_FALSE(o.broker.deliveries);
}

TEST(OptionsTest, ReadsNestedKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"sessions_dir\":\"/var/lib/chatgate\","
        "\"rate\":{\"max_sends\":5,\"window_ms\":1000},"
        "\"webhook\":{\"url\":\"https://hooks.example/in\",\"secret\":\"S1\",\"max_attempts\":5},"
        "\"gateway\":{\"port\":9090,\"api_keys\":[\"k1\"]},"
        "\"broker\":{\"backlog\":50},"
        "\"bridge\":{\"url\":\"http://bridge:3001\",\"poll_ms\":250}}"));
    GatewayOptions o = GatewayOptions::from_config(cfg);

    EXPECT_EQ("", o.validate());
    EXPECT_EQ("/var/lib/chatgate", o.registry.sessions_dir);
    EXPECT_EQ("/var/lib/chatgate/sessions.db", o.database);
    EXPECT_EQ(5, o.registry.session.rate_max_sends);
    EXPECT_EQ(1000, o.registry.session.rate_window_ms);
    EXPECT_EQ("https://hooks.example/in", o.webhook.url);
    EXPECT_EQ("S1", o.webhook.secret);
    EXPECT_TRUE(o.broker.deliveries);
    EXPECT_EQ(5, o.broker.default_max_attempts);
    EXPECT_EQ(50u, o.broker.backlog);
    EXPECT_EQ(9090, o.port);
    ASSERT_EQ(1u, o.api_keys.size());
    EXPECT_EQ("http://bridge:3001", o.bridge_url);
    EXPECT_EQ(250, o.bridge_poll_ms);
}

TEST(OptionsTest, ValidateRejectsNonsense) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"reconnect\":{\"min_ms\":5000,\"max_ms\":1000}}"));
    EXPECT_NE("", GatewayOptions::from_config(cfg).validate());

    ASSERT_TRUE(cfg.load_string("{\"gateway\":{\"port\":70000}}"));
    EXPECT_NE("", GatewayOptions::from_config(cfg).validate());

    ASSERT_TRUE(cfg.load_string("{\"rate\":{\"max_sends\":0}}"));
    EXPECT_NE("", GatewayOptions::from_config(cfg).validate());
}
