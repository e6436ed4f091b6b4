/*
 * chatgate - Sequenced event log
 *
 * Every connection change, message and delivery status passes through
 * EventBroker::append. Events carry a strictly increasing sequence, are
 * retained in a bounded ring and fanned out to live subscriptions, which
 * can resume from the last id they saw.
 */
#ifndef CHATGATE_BROKER_EVENT_BROKER_HPP
#define CHATGATE_BROKER_EVENT_BROKER_HPP

#include <chatgate/core/json.hpp>
#include <chatgate/core/scheduler.hpp>

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <cstdint>

namespace chatgate {

enum class EventDirection {
    INBOUND,
    OUTBOUND,
    SYSTEM
};

const char* event_direction_str(EventDirection d);
bool parse_event_direction(const std::string& text, EventDirection& out);

// Webhook delivery bookkeeping attached to deliverable events
struct DeliveryRecord {
    std::string state;          // pending | retry | success | failed
    int attempts;
    int max_attempts;
    int64_t last_attempt_at;    // 0 before the first attempt
    long last_status;           // HTTP status of the last attempt, 0 if none
    std::string last_error;

    DeliveryRecord()
        : state("pending"), attempts(0), max_attempts(0)
        , last_attempt_at(0), last_status(0) {}

    Json to_json() const;
};

struct BrokerEvent {
    std::string id;
    int64_t sequence;
    std::string type;
    std::string scope;          // session id or "global"
    EventDirection direction;
    Json payload;
    int64_t created_at;
    bool acknowledged;
    bool has_delivery;
    DeliveryRecord delivery;

    BrokerEvent()
        : sequence(0), direction(EventDirection::SYSTEM), created_at(0)
        , acknowledged(false), has_delivery(false) {}

    Json to_json() const;
};

struct EventDraft {
    std::string type;
    std::string scope;
    EventDirection direction;
    Json payload;
    bool deliver;               // eligible for webhook delivery
    int max_attempts;           // 0 uses the broker default

    EventDraft()
        : scope("global"), direction(EventDirection::SYSTEM)
        , deliver(true), max_attempts(0) {}

    EventDraft(const std::string& t, const std::string& s, EventDirection d, const Json& p)
        : type(t), scope(s), direction(d), payload(p), deliver(true), max_attempts(0) {}
};

// Empty fields match everything
struct EventFilter {
    std::string scope;
    std::string type;
    std::string direction;

    bool matches(const BrokerEvent& ev) const;
};

struct ListQuery {
    std::string after;          // event id cursor
    int limit;
    EventFilter filter;

    ListQuery() : limit(50) {}
};

struct AckOutcome {
    std::vector<std::string> acknowledged;
    std::vector<std::string> missing;

    Json to_json() const;
};

struct BrokerMetrics {
    int64_t pending;            // retained and not acknowledged
    int64_t total;              // retained
    int64_t last_event_at;      // 0 when empty
    int64_t last_ack_at;        // 0 when never acknowledged
    int64_t last_sequence;

    BrokerMetrics()
        : pending(0), total(0), last_event_at(0), last_ack_at(0), last_sequence(0) {}

    Json to_json() const;
};

class EventBroker;

// One reader of the event stream. Owned by whoever consumes it; dropping
// the last shared_ptr releases it, the broker only keeps a weak reference.
class Subscription {
public:
    enum NextResult { EVENT, TIMEOUT, CLOSED };

    Subscription(const std::string& id, const EventFilter& filter, size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Blocks up to timeout_ms. Queued events are drained before CLOSED
    // is reported.
    NextResult next(int64_t timeout_ms, BrokerEvent& out);

    void close(const std::string& reason);
    bool closed() const;
    std::string close_reason() const;

    const std::string& id() const { return id_; }
    const EventFilter& filter() const { return filter_; }
    size_t queued() const;

private:
    friend class EventBroker;

    // Live delivery; false when the queue is full (the caller closes us)
    bool offer(const BrokerEvent& ev);
    // Replay ignores capacity
    void preload(const BrokerEvent& ev);

    std::string id_;
    EventFilter filter_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<BrokerEvent> queue_;
    bool closed_;
    std::string reason_;
};

class EventBroker {
public:
    typedef std::function<void(const BrokerEvent&)> Listener;

    struct Options {
        size_t backlog;
        size_t subscriber_queue;
        bool deliveries;            // attach a DeliveryRecord to deliverable drafts
        int default_max_attempts;

        Options()
            : backlog(200), subscriber_queue(256), deliveries(false), default_max_attempts(3) {}
    };

    // Timestamps come from the wall clock
    explicit EventBroker(const Options& options = Options());
    // Timestamps come from clock, which must outlive the broker
    explicit EventBroker(Scheduler& clock, const Options& options = Options());

    EventBroker(const EventBroker&) = delete;
    EventBroker& operator=(const EventBroker&) = delete;

    BrokerEvent append(const EventDraft& draft);

    // Replays retained events after last_event_id (the whole backlog when
    // the id is empty, unknown or evicted), then tails live.
    std::shared_ptr<Subscription> subscribe(const std::string& last_event_id,
                                            const EventFilter& filter = EventFilter());
    void unsubscribe(const std::shared_ptr<Subscription>& sub);

    // In-process listeners are called for every event, in sequence order,
    // outside the broker lock. A listener must not call append().
    void add_listener(const Listener& listener);

    // With a scope, ids of events outside it are reported missing
    AckOutcome ack(const std::vector<std::string>& ids, const std::string& scope = "");

    // Unacknowledged events after the cursor, oldest first
    std::vector<BrokerEvent> list(const ListQuery& query) const;

    // Newest first, acknowledged included
    std::vector<BrokerEvent> recent(int limit, const EventFilter& filter = EventFilter()) const;

    bool find(const std::string& id, BrokerEvent& out) const;
    bool update_delivery(const std::string& id, const DeliveryRecord& record);

    BrokerMetrics metrics() const;
    size_t subscribers() const;

    // Closes every subscription with the given reason
    void close_all(const std::string& reason);

private:
    static int clamp_limit(int limit);
    int64_t now_ms() const;

    Options options_;
    Scheduler* clock_;

    mutable std::mutex mutex_;
    std::mutex publish_mutex_;     // keeps fan-out in sequence order
    std::deque<BrokerEvent> ring_;
    std::map<std::string, int64_t> index_;   // id -> sequence
    std::vector<std::weak_ptr<Subscription> > subscriptions_;
    std::vector<Listener> listeners_;
    int64_t sequence_;
    int64_t last_ack_at_;
    uint64_t next_subscription_;
};

} // namespace chatgate

#endif // CHATGATE_BROKER_EVENT_BROKER_HPP
