#include <chatgate/session/registry.hpp>
#include <chatgate/webhook/dispatcher.hpp>
#include <chatgate/core/utils.hpp>
#include "support/manual_scheduler.hpp"
#include "support/fake_socket.hpp"
#include "support/fake_transport.hpp"
#include "support/wait.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <thread>
#include <chrono>

using namespace chatgate;
using chatgate::testing::ManualScheduler;
using chatgate::testing::FakeSocketFactory;
using chatgate::testing::FakeLink;
using chatgate::testing::FakeTransport;
using chatgate::testing::wait_until;

namespace {

class ScenarioTest : public ::testing::Test {
protected:
    ScenarioTest() : pool(4) {}

    void SetUp() {
        char tmpl[] = "/tmp/chatgate-scenario-XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_TRUE(dir != NULL);
        root = dir;
        ASSERT_TRUE(store.open(":memory:"));
        ASSERT_TRUE(store.ensure_schema());

        SessionRegistry::Options opts;
        opts.sessions_dir = root;
        registry.reset(new SessionRegistry(store, factory, clock, pool, broker, opts));
    }

    void TearDown() {
        registry.reset();
        remove_tree(root);
    }

    // Creates the session and brings its socket to open
    std::shared_ptr<Session> open_session(const std::string& name) {
        std::shared_ptr<Session> s = registry->create(name);
        factory.last(s->id())->emit_open();
        return s;
    }

    std::string root;
    ManualScheduler clock;
    FakeSocketFactory factory;
    EventBroker broker;
    ThreadPool pool;
    SessionStore store;
    std::unique_ptr<SessionRegistry> registry;
};

} // namespace

TEST_F(ScenarioTest, NewSessionShowsFirstQr) {
    std::shared_ptr<Session> s = registry->create("support-a");
    EXPECT_EQ("support-a", s->id());
    EXPECT_EQ(ConnectionState::CONNECTING, s->state());

    int64_t now = clock.now_ms();
    factory.last("support-a")->emit_qr("2@challenge");

    ConnectionSnapshot c = s->connection();
    EXPECT_EQ("2@challenge", c.last_challenge);
    EXPECT_EQ(1, c.qr_version);
    EXPECT_EQ(now + 60000, c.qr_expires_at);
    EXPECT_EQ(1, c.pairing_attempts);

    EventFilter f;
    f.type = "qr";
    f.scope = "support-a";
    std::vector<BrokerEvent> qr = broker.recent(10, f);
    ASSERT_EQ(1u, qr.size());
    EXPECT_EQ(1, qr[0].payload["qrVersion"].as_int());

    Json j = s->to_json();
    EXPECT_EQ("connecting", j["connectionState"].as_string());
    EXPECT_FALSE(j["connected"].as_bool());
}

TEST_F(ScenarioTest, SendWaitsForServerAck) {
    std::shared_ptr<Session> s = open_session("support-a");

    SendReceipt receipt;
    std::thread caller([&s, &receipt] {
        receipt = s->send_text("+55 11 99999-8888", "hello", 8000);
    });

    EXPECT_TRUE(wait_until([&s] { return s->ledger()->waiting() == 1; }));
    clock.advance(2000);
    factory.last("support-a")->emit_status("support-a-msg-1", message_status::SERVER_ACK);
    caller.join();

    EXPECT_EQ("support-a-msg-1", receipt.message_id);
    EXPECT_EQ("5511999998888@s.whatsapp.net", receipt.to);
    EXPECT_TRUE(receipt.ack.acked);
    EXPECT_EQ(message_status::SERVER_ACK, receipt.ack.status);
    EXPECT_EQ(2000, s->ledger()->metrics().ack.avg_ms);
    EXPECT_EQ(message_status::SERVER_ACK, s->status_of("support-a-msg-1"));

    Json sent = factory.last("support-a")->sent()[0];
    EXPECT_EQ("text", sent["type"].as_string());
    EXPECT_EQ("hello", sent["text"].as_string());

    EventFilter f;
    f.type = "message.status";
    std::vector<BrokerEvent> statuses = broker.recent(10, f);
    ASSERT_EQ(1u, statuses.size());
    EXPECT_EQ(2000, statuses[0].payload["latencyMs"].as_int());
}

TEST_F(ScenarioTest, AckWaitTimesOutWithoutError) {
    std::shared_ptr<Session> s = open_session("support-a");

    SendReceipt receipt;
    std::thread caller([&s, &receipt] {
        receipt = s->send_text("5511999998888", "hello", 8000);
    });
    EXPECT_TRUE(wait_until([&s] { return s->ledger()->waiting() == 1; }));
    clock.advance(8000);
    caller.join();

    EXPECT_FALSE(receipt.ack.acked);
    EXPECT_TRUE(receipt.to_json()["ack"].is_null());
    EXPECT_EQ(message_status::PENDING, s->status_of(receipt.message_id));
}

TEST_F(ScenarioTest, LogoutReleasesAckWaiters) {
    std::shared_ptr<Session> s = open_session("support-a");

    SendReceipt receipt;
    std::thread caller([&s, &receipt] {
        receipt = s->send_text("5511999998888", "hello", 60000);
    });
    EXPECT_TRUE(wait_until([&s] { return s->ledger()->waiting() == 1; }));
    registry->logout("support-a");
    caller.join();

    EXPECT_FALSE(receipt.ack.acked);
    EXPECT_EQ(ConnectionState::CLOSE, s->state());
    EXPECT_EQ(1, factory.last("support-a")->logout_calls());
}

TEST_F(ScenarioTest, SendThatTimesOutIsStillTracked) {
    SessionRegistry::Options opts;
    opts.sessions_dir = root;
    opts.session.send_timeout_ms = 50;
    registry.reset(new SessionRegistry(store, factory, clock, pool, broker, opts));

    std::shared_ptr<Session> s = open_session("slow-a");
    factory.last("slow-a")->set_send_delay_ms(300);
    try {
        s->send_text("5511999998888", "hello");
        FAIL() << "a stalled socket must time the caller out";
    } catch (const GatewayError& e) {
        EXPECT_EQ(ErrorKind::UNAVAILABLE, e.kind());
        EXPECT_EQ("send_timeout", e.code());
    }

    // the socket still takes the message; the session must know about it
    EventFilter f;
    f.type = "message";
    f.scope = "slow-a";
    EXPECT_TRUE(wait_until([this, &f] { return broker.recent(10, f).size() == 1; }));
    EXPECT_EQ(message_status::PENDING, s->status_of("slow-a-msg-1"));
    EXPECT_EQ(1u, factory.last("slow-a")->sent().size());
    EXPECT_EQ(1, s->metrics_json()["sent"].as_int());

    std::vector<BrokerEvent> outbound = broker.recent(10, f);
    ASSERT_EQ(1u, outbound.size());
    EXPECT_EQ("slow-a-msg-1", outbound[0].payload["messageId"].as_string());

    factory.last("slow-a")->emit_status("slow-a-msg-1", message_status::SERVER_ACK);
    EXPECT_EQ(message_status::SERVER_ACK, s->status_of("slow-a-msg-1"));
}

TEST_F(ScenarioTest, StalledReconnectDoesNotDelayOtherSessions) {
    std::shared_ptr<Session> a = open_session("alpha");
    std::shared_ptr<Session> b = open_session("beta");

    // alpha's next socket hangs in open() for two seconds
    factory.set_open_delay_ms(2000);
    factory.last("alpha")->emit_close(500, "stream errored");

    SendReceipt receipt;
    std::thread caller([&b, &receipt] {
        receipt = b->send_text("5511999998888", "hello", 2000);
    });
    EXPECT_TRUE(wait_until([&b] { return b->ledger()->waiting() == 1; }));

    // fires alpha's reconnect at +1000, then beta's ack deadline at +2000
    std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
    clock.advance(2000);
    caller.join();
    int64_t took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - before).count();

    EXPECT_LT(took, 1000);
    EXPECT_FALSE(receipt.ack.acked);
    EXPECT_TRUE(wait_until([this] { return factory.created() == 3; }));
    EXPECT_EQ(ConnectionState::OPEN, b->state());
}

TEST_F(ScenarioTest, SlowPollHoldsUpOnlyItsOwnSession) {
    open_session("alpha");
    open_session("beta");
    factory.last("alpha")->set_poll_delay_ms(1000);

    std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
    registry->poll();
    registry->poll();
    int64_t took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - before).count();
    EXPECT_LT(took, 500);

    std::shared_ptr<FakeLink> beta = factory.last("beta");
    EXPECT_TRUE(wait_until([&beta] { return beta->poll_calls() >= 1; }));
    EXPECT_EQ(0, factory.last("alpha")->poll_calls());

    // the second round found alpha's poll still queued and skipped it
    std::shared_ptr<FakeLink> alpha = factory.last("alpha");
    EXPECT_TRUE(wait_until([&alpha] { return alpha->poll_calls() == 1; }));
    EXPECT_EQ(1, alpha->poll_calls());
}

TEST_F(ScenarioTest, TwentyFirstSendInWindowIsRejected) {
    std::shared_ptr<Session> s = open_session("support-a");
    for (int i = 0; i < 20; ++i) {
        s->send_text("5511999998888", "msg " + std::to_string(i));
    }
    try {
        s->send_text("5511999998888", "one too many");
        FAIL() << "21st send must be rate limited";
    } catch (const GatewayError& e) {
        EXPECT_EQ(ErrorKind::RATE_LIMITED, e.kind());
        EXPECT_EQ("rate_limit_exceeded", e.code());
    }
    EXPECT_EQ(20u, factory.last("support-a")->sent().size());

    clock.advance(15000);
    EXPECT_NO_THROW(s->send_text("5511999998888", "window moved"));
}

TEST_F(ScenarioTest, SendsKeepArrivalOrder) {
    std::shared_ptr<Session> s = open_session("support-a");
    for (int i = 0; i < 5; ++i) {
        s->send_text("5511999998888", "n" + std::to_string(i));
    }
    std::vector<Json> sent = factory.last("support-a")->sent();
    ASSERT_EQ(5u, sent.size());
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ("n" + std::to_string(i), sent[i]["text"].as_string());
    }
}

TEST_F(ScenarioTest, SendValidation) {
    std::shared_ptr<Session> s = registry->create("support-a");

    try {
        s->send_text("5511999998888", "hello");
        FAIL() << "send before open must throw";
    } catch (const GatewayError& e) {
        EXPECT_EQ(ErrorKind::UNAVAILABLE, e.kind());
    }

    factory.last("support-a")->emit_open();
    try {
        s->send_text("123", "hello");
        FAIL() << "short number must throw";
    } catch (const GatewayError& e) {
        EXPECT_EQ("to_invalid", e.code());
    }
    try {
        s->send_text("5511999998888", "   ");
        FAIL() << "blank text must throw";
    } catch (const GatewayError& e) {
        EXPECT_EQ("text_required", e.code());
    }

    PollMessage poll;
    poll.question = "Lunch?";
    poll.options.push_back("only one");
    EXPECT_THROW(s->send_poll("5511999998888", poll), GatewayError);

    MediaMessage media;
    media.type = "image";
    EXPECT_THROW(s->send_media("5511999998888", media), GatewayError);
    media.url = "ftp://x/y.png";
    EXPECT_THROW(s->send_media("5511999998888", media), GatewayError);

    EXPECT_TRUE(factory.last("support-a")->sent().empty());
}

TEST_F(ScenarioTest, RicherMessageKinds) {
    std::shared_ptr<Session> s = open_session("support-a");

    PollMessage poll;
    poll.question = "Lunch?";
    poll.options.push_back("yes");
    poll.options.push_back("no");
    poll.selectable_count = 9;
    SendReceipt r = s->send_poll("5511999998888", poll);
    EXPECT_EQ(2, r.extra["selectableCount"].as_int());

    MediaMessage doc;
    doc.type = "document";
    doc.base64 = "QUJD";
    r = s->send_media("5511999998888", doc);
    EXPECT_EQ(3, r.extra["size"].as_int());

    std::vector<Json> sent = factory.last("support-a")->sent();
    ASSERT_EQ(2u, sent.size());
    EXPECT_EQ("application/octet-stream", sent[1]["media"]["mimetype"].as_string());
    EXPECT_EQ("file", sent[1]["media"]["fileName"].as_string());

    Json metrics = s->metrics_json();
    EXPECT_EQ(1, metrics["sentByType"]["polls"].as_int());
    EXPECT_EQ(1, metrics["sentByType"]["document"].as_int());
}

TEST_F(ScenarioTest, InboundMessagesReachTheBroker) {
    std::shared_ptr<Session> s = open_session("support-a");
    std::shared_ptr<Subscription> sub = broker.subscribe("", EventFilter());
    BrokerEvent ev;
    while (sub->next(0, ev) == Subscription::EVENT) {}

    InboundMessage m;
    m.id = "in-1";
    m.from = "5511999998888@s.whatsapp.net";
    m.chat = m.from;
    m.type = "text";
    m.text = "oi";
    factory.last("support-a")->emit_message(m);

    ASSERT_EQ(Subscription::EVENT, sub->next(0, ev));
    EXPECT_EQ("message", ev.type);
    EXPECT_EQ("support-a", ev.scope);
    EXPECT_EQ(EventDirection::INBOUND, ev.direction);
    broker.unsubscribe(sub);
}

TEST(WebhookScenarioTest, RetryThenSuccess) {
    ManualScheduler clock;
    EventBroker::Options opts;
    opts.deliveries = true;
    EventBroker broker(clock, opts);
    ThreadPool pool(2);
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    transport->respond(500);
    transport->respond(200);

    WebhookDispatcher::Options wopts;
    wopts.url = "http://hooks.test/in";
    wopts.secret = "S1";
    std::shared_ptr<WebhookDispatcher> dispatcher =
        std::make_shared<WebhookDispatcher>(broker, clock, pool, transport, wopts);
    dispatcher->start();

    Json payload = Json::object();
    payload["messageId"] = "support-a-msg-1";
    BrokerEvent ev = broker.append(EventDraft("message", "support-a", EventDirection::OUTBOUND, payload));
    EXPECT_EQ("pending", ev.delivery.state);

    BrokerEvent stored;
    ASSERT_TRUE(wait_until([&] { return clock.pending() == 1; }));
    ASSERT_TRUE(broker.find(ev.id, stored));
    EXPECT_EQ("retry", stored.delivery.state);
    EXPECT_EQ(1, stored.delivery.attempts);
    EXPECT_EQ(500, stored.delivery.last_status);
    EXPECT_EQ(stored.created_at, stored.delivery.last_attempt_at);

    clock.advance(clock.next_delay());
    ASSERT_TRUE(wait_until([&] {
        return broker.find(ev.id, stored) && stored.delivery.state == "success";
    }));
    EXPECT_EQ(2, stored.delivery.attempts);
    EXPECT_EQ(200, stored.delivery.last_status);

    dispatcher->stop();
    pool.shutdown();
}
