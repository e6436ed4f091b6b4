#include <chatgate/webhook/dispatcher.hpp>
#include <chatgate/webhook/signature.hpp>
#include "support/manual_scheduler.hpp"
#include "support/fake_transport.hpp"
#include "support/wait.hpp"

#include <gtest/gtest.h>

using namespace chatgate;
using chatgate::testing::ManualScheduler;
using chatgate::testing::FakeTransport;
using chatgate::testing::RecordedPost;
using chatgate::testing::wait_until;

namespace {

EventBroker::Options delivering(int max_attempts) {
    EventBroker::Options opts;
    opts.deliveries = true;
    opts.default_max_attempts = max_attempts;
    return opts;
}

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest()
        : broker(delivering(3))
        , pool(2)
        , transport(std::make_shared<FakeTransport>()) {}

    void SetUp() {
        WebhookDispatcher::Options opts;
        opts.url = "http://hooks.test/in";
        opts.secret = "S1";
        opts.api_key = "hook-key";
        opts.retry_base_ms = 2000;
        dispatcher = std::make_shared<WebhookDispatcher>(broker, clock, pool, transport, opts);
        dispatcher->start();
    }

    void TearDown() {
        dispatcher->stop();
        pool.shutdown();
    }

    BrokerEvent publish() {
        Json payload = Json::object();
        payload["text"] = "hello";
        return broker.append(EventDraft("message", "s1", EventDirection::INBOUND, payload));
    }

    DeliveryRecord delivery_of(const std::string& id) {
        BrokerEvent ev;
        EXPECT_TRUE(broker.find(id, ev));
        return ev.delivery;
    }

    bool state_is(const std::string& id, const std::string& state) {
        BrokerEvent ev;
        return broker.find(id, ev) && ev.delivery.state == state;
    }

    ManualScheduler clock;
    EventBroker broker;
    ThreadPool pool;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<WebhookDispatcher> dispatcher;
};

} // namespace

TEST_F(DispatcherTest, DeliversSignedBody) {
    BrokerEvent ev = publish();
    ASSERT_TRUE(wait_until([&] { return state_is(ev.id, "success"); }));

    std::vector<RecordedPost> posts = transport->posts();
    ASSERT_EQ(1u, posts.size());
    EXPECT_EQ("http://hooks.test/in", posts[0].url);
    EXPECT_EQ(WebhookDispatcher::build_body(ev), posts[0].body);
    EXPECT_TRUE(verify_signature("S1", posts[0].body, posts[0].headers[SIGNATURE_HEADER]));
    EXPECT_EQ("hook-key", posts[0].headers["x-api-key"]);

    Json body = Json::parse(posts[0].body);
    EXPECT_EQ(ev.id, body["id"].as_string());
    EXPECT_EQ("message", body["event"].as_string());
    EXPECT_EQ("hello", body["payload"]["text"].as_string());

    DeliveryRecord rec = delivery_of(ev.id);
    EXPECT_EQ(1, rec.attempts);
    EXPECT_EQ(200, rec.last_status);
    EXPECT_TRUE(rec.last_error.empty());
    EXPECT_GT(rec.last_attempt_at, 0);
}

TEST_F(DispatcherTest, RetriesWithLinearBackoffThenSucceeds) {
    transport->respond(503);
    transport->respond(0);
    BrokerEvent ev = publish();

    ASSERT_TRUE(wait_until([&] { return clock.pending() == 1; }));
    EXPECT_EQ("retry", delivery_of(ev.id).state);
    EXPECT_EQ(503, delivery_of(ev.id).last_status);
    EXPECT_EQ(2000, clock.next_delay());

    clock.advance(2000);
    ASSERT_TRUE(wait_until([&] { return delivery_of(ev.id).attempts == 2 && clock.pending() == 1; }));
    EXPECT_EQ("retry", delivery_of(ev.id).state);
    EXPECT_EQ("connection refused", delivery_of(ev.id).last_error);
    EXPECT_EQ(4000, clock.next_delay());

    clock.advance(4000);
    ASSERT_TRUE(wait_until([&] { return state_is(ev.id, "success"); }));
    EXPECT_EQ(3, delivery_of(ev.id).attempts);
    EXPECT_EQ(3u, transport->count());

    DispatcherMetrics m = dispatcher->metrics();
    EXPECT_EQ(3, m.attempts);
    EXPECT_EQ(2, m.retried);
    EXPECT_EQ(1, m.delivered);
    EXPECT_EQ(0, m.in_flight);
}

TEST_F(DispatcherTest, FailsAfterMaxAttempts) {
    transport->respond(500);
    transport->respond(500);
    transport->respond(500);
    transport->respond(200);
    BrokerEvent ev = publish();

    ASSERT_TRUE(wait_until([&] { return clock.pending() == 1; }));
    clock.advance(2000);
    ASSERT_TRUE(wait_until([&] { return delivery_of(ev.id).attempts == 2 && clock.pending() == 1; }));
    clock.advance(4000);
    ASSERT_TRUE(wait_until([&] { return state_is(ev.id, "failed"); }));

    DeliveryRecord rec = delivery_of(ev.id);
    EXPECT_EQ(3, rec.attempts);
    EXPECT_EQ(3, rec.max_attempts);
    EXPECT_EQ("HTTP 500", rec.last_error);

    // failed is terminal: nothing more is scheduled or sent
    EXPECT_EQ(0u, clock.pending());
    clock.advance(60000);
    EXPECT_EQ(3u, transport->count());
    EXPECT_EQ(1, dispatcher->metrics().failed);
}

TEST_F(DispatcherTest, IgnoresEventsWithoutDeliveryRecord) {
    EventDraft draft("webhook", "global", EventDirection::INBOUND, Json::object());
    draft.deliver = false;
    broker.append(draft);
    BrokerEvent ev = publish();
    ASSERT_TRUE(wait_until([&] { return state_is(ev.id, "success"); }));
    EXPECT_EQ(1u, transport->count());
}

TEST_F(DispatcherTest, StopCancelsPendingRetry) {
    transport->respond(502);
    BrokerEvent ev = publish();
    ASSERT_TRUE(wait_until([&] { return clock.pending() == 1; }));

    dispatcher->stop();
    EXPECT_EQ(0u, clock.pending());
    clock.advance(10000);
    EXPECT_EQ(1u, transport->count());
    EXPECT_EQ("retry", delivery_of(ev.id).state);
}

TEST(DispatcherDisabledTest, NoUrlMeansNoPosts) {
    ManualScheduler clock;
    EventBroker broker(delivering(3));
    ThreadPool pool(1);
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<WebhookDispatcher> dispatcher =
        std::make_shared<WebhookDispatcher>(broker, clock, pool, transport);
    dispatcher->start();
    EXPECT_FALSE(dispatcher->enabled());

    broker.append(EventDraft("message", "s1", EventDirection::INBOUND, Json::object()));
    pool.shutdown();
    EXPECT_EQ(0u, transport->count());
}
