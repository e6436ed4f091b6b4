#include <chatgate/bridge/bridge_socket.hpp>

#include <gtest/gtest.h>
#include <curl/curl.h>

using namespace chatgate;

namespace {

class RecordingListener : public SocketListener {
public:
    void on_connection(const ConnectionUpdate& update) { connections.push_back(update); }
    void on_qr(const std::string& challenge) { challenges.push_back(challenge); }
    void on_message(const InboundMessage& message) { messages.push_back(message); }
    void on_status(const StatusUpdate& update) { statuses.push_back(update); }

    std::vector<ConnectionUpdate> connections;
    std::vector<std::string> challenges;
    std::vector<InboundMessage> messages;
    std::vector<StatusUpdate> statuses;
};

} // namespace

TEST(BridgeEventTest, ConnectionEvents) {
    RecordingListener l;
    ASSERT_TRUE(BridgeSocket::dispatch_event(Json::parse(
        "{\"kind\":\"connection\",\"state\":\"open\",\"phone\":\"5511999998888\"}"), l));
    ASSERT_TRUE(BridgeSocket::dispatch_event(Json::parse(
        "{\"kind\":\"connection\",\"state\":\"close\",\"statusCode\":401,"
        "\"reason\":\"logged out\",\"loggedOut\":true}"), l));
    ASSERT_TRUE(BridgeSocket::dispatch_event(Json::parse(
        "{\"kind\":\"connection\",\"state\":\"connecting\"}"), l));

    ASSERT_EQ(3u, l.connections.size());
    EXPECT_EQ(ConnectionState::OPEN, l.connections[0].state);
    EXPECT_EQ("5511999998888", l.connections[0].phone_number);
    EXPECT_EQ(ConnectionState::CLOSE, l.connections[1].state);
    EXPECT_EQ(401, l.connections[1].status_code);
    EXPECT_TRUE(l.connections[1].logged_out);
    EXPECT_EQ(ConnectionState::CONNECTING, l.connections[2].state);
}

TEST(BridgeEventTest, QrNeedsChallenge) {
    RecordingListener l;
    EXPECT_TRUE(BridgeSocket::dispatch_event(Json::parse("{\"kind\":\"qr\",\"qr\":\"2@abc\"}"), l));
    EXPECT_FALSE(BridgeSocket::dispatch_event(Json::parse("{\"kind\":\"qr\"}"), l));
    ASSERT_EQ(1u, l.challenges.size());
    EXPECT_EQ("2@abc", l.challenges[0]);
}

TEST(BridgeEventTest, MessageFields) {
    RecordingListener l;
    ASSERT_TRUE(BridgeSocket::dispatch_event(Json::parse(
        "{\"kind\":\"message\",\"id\":\"in-1\",\"from\":\"5511@s.whatsapp.net\","
        "\"from_name\":\"Ana\",\"text\":\"oi\",\"timestamp\":1700000000123,"
        "\"raw\":{\"k\":1}}"), l));
    ASSERT_EQ(1u, l.messages.size());
    const InboundMessage& m = l.messages[0];
    EXPECT_EQ("in-1", m.id);
    EXPECT_EQ("5511@s.whatsapp.net", m.chat);
    EXPECT_EQ("Ana", m.push_name);
    EXPECT_EQ("text", m.type);
    EXPECT_EQ(1700000000123LL, m.timestamp);
    EXPECT_FALSE(m.from_me);
    EXPECT_EQ(1, m.raw["k"].as_int());
}

TEST(BridgeEventTest, StatusNeedsMessageId) {
    RecordingListener l;
    EXPECT_TRUE(BridgeSocket::dispatch_event(Json::parse(
        "{\"kind\":\"status\",\"id\":\"m1\",\"status\":3}"), l));
    EXPECT_FALSE(BridgeSocket::dispatch_event(Json::parse("{\"kind\":\"status\",\"status\":3}"), l));
    ASSERT_EQ(1u, l.statuses.size());
    EXPECT_EQ("m1", l.statuses[0].message_id);
    EXPECT_EQ(3, l.statuses[0].status);
}

TEST(BridgeEventTest, UnknownKindIgnored) {
    RecordingListener l;
    EXPECT_FALSE(BridgeSocket::dispatch_event(Json::parse("{\"kind\":\"presence\"}"), l));
    EXPECT_FALSE(BridgeSocket::dispatch_event(Json::parse("{}"), l));
}

TEST(BridgeSocketTest, UnreachableBridgeFailsCleanly) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    {
        std::shared_ptr<RecordingListener> l = std::make_shared<RecordingListener>();
        BridgeSocketFactory factory("http://127.0.0.1:1/", 500);
        std::unique_ptr<SessionSocket> socket = factory.create("alpha", "/tmp/alpha", l);

        EXPECT_FALSE(socket->open());

        Json msg = Json::object();
        msg["to"] = "5511999998888@s.whatsapp.net";
        msg["type"] = "text";
        msg["text"] = "hi";
        SendResult r = socket->send(msg);
        EXPECT_FALSE(r.success);
        EXPECT_FALSE(r.error.empty());

        std::string png;
        std::string error;
        EXPECT_FALSE(socket->qr_image(png, error));

        socket->poll();
        EXPECT_TRUE(l->connections.empty());
        socket->close();
    }
    curl_global_cleanup();
}
