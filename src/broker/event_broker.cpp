#include <chatgate/broker/event_broker.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>
#include <algorithm>
#include <chrono>

namespace chatgate {

const char* event_direction_str(EventDirection d) {
    switch (d) {
        case EventDirection::INBOUND:  return "inbound";
        case EventDirection::OUTBOUND: return "outbound";
        case EventDirection::SYSTEM:   return "system";
    }
    return "system";
}

bool parse_event_direction(const std::string& text, EventDirection& out) {
    std::string t = to_lower(trim(text));
    if (t == "inbound") { out = EventDirection::INBOUND; return true; }
    if (t == "outbound") { out = EventDirection::OUTBOUND; return true; }
    if (t == "system") { out = EventDirection::SYSTEM; return true; }
    return false;
}

// ============ Value types ============

Json DeliveryRecord::to_json() const {
    Json j = Json::object();
    j["state"] = state;
    j["attempts"] = attempts;
    j["maxAttempts"] = max_attempts;
    j["lastAttemptAt"] = last_attempt_at > 0 ? Json(last_attempt_at) : Json();
    j["lastStatus"] = last_status > 0 ? Json(static_cast<int64_t>(last_status)) : Json();
    j["lastError"] = last_error.empty() ? Json() : Json(last_error);
    return j;
}

Json BrokerEvent::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["sequence"] = sequence;
    j["type"] = type;
    j["sessionId"] = scope;
    j["direction"] = event_direction_str(direction);
    j["payload"] = payload;
    j["createdAt"] = created_at;
    j["acknowledged"] = acknowledged;
    if (has_delivery) {
        j["delivery"] = delivery.to_json();
    }
    return j;
}

bool EventFilter::matches(const BrokerEvent& ev) const {
    if (!scope.empty() && ev.scope != scope) return false;
    if (!type.empty() && ev.type != type) return false;
    if (!direction.empty() && direction != event_direction_str(ev.direction)) return false;
    return true;
}

Json AckOutcome::to_json() const {
    Json j = Json::object();
    Json acked = Json::array();
    for (size_t i = 0; i < acknowledged.size(); ++i) acked.push_back(acknowledged[i]);
    Json miss = Json::array();
    for (size_t i = 0; i < missing.size(); ++i) miss.push_back(missing[i]);
    j["acknowledged"] = acked;
    j["missing"] = miss;
    return j;
}

Json BrokerMetrics::to_json() const {
    Json j = Json::object();
    j["pending"] = pending;
    j["total"] = total;
    j["lastEventAt"] = last_event_at > 0 ? Json(last_event_at) : Json();
    j["lastAckAt"] = last_ack_at > 0 ? Json(last_ack_at) : Json();
    j["lastSequence"] = last_sequence;
    return j;
}

// ============ Subscription ============

Subscription::Subscription(const std::string& id, const EventFilter& filter, size_t capacity)
    : id_(id)
    , filter_(filter)
    , capacity_(capacity > 0 ? capacity : 1)
    , closed_(false) {}

bool Subscription::offer(const BrokerEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return true;
    if (queue_.size() >= capacity_) return false;
    queue_.push_back(ev);
    ready_.notify_one();
    return true;
}

void Subscription::preload(const BrokerEvent& ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(ev);
}

Subscription::NextResult Subscription::next(int64_t timeout_ms, BrokerEvent& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty() && !closed_) {
        ready_.wait_for(lock, std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0),
                        [this] { return !queue_.empty() || closed_; });
    }
    if (!queue_.empty()) {
        out = queue_.front();
        queue_.pop_front();
        return EVENT;
    }
    return closed_ ? CLOSED : TIMEOUT;
}

void Subscription::close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
    reason_ = reason;
    ready_.notify_all();
}

bool Subscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::string Subscription::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

size_t Subscription::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============ EventBroker ============

EventBroker::EventBroker(const Options& options)
    : options_(options)
    , clock_(nullptr)
    , sequence_(0)
    , last_ack_at_(0)
    , next_subscription_(0) {
    if (options_.backlog == 0) options_.backlog = 1;
}

EventBroker::EventBroker(Scheduler& clock, const Options& options)
    : options_(options)
    , clock_(&clock)
    , sequence_(0)
    , last_ack_at_(0)
    , next_subscription_(0) {
    if (options_.backlog == 0) options_.backlog = 1;
}

int64_t EventBroker::now_ms() const {
    return clock_ ? clock_->now_ms() : current_timestamp_ms();
}

int EventBroker::clamp_limit(int limit) {
    if (limit <= 0) return 50;
    return clamp(limit, 1, 200);
}

BrokerEvent EventBroker::append(const EventDraft& draft) {
    std::lock_guard<std::mutex> publish(publish_mutex_);

    BrokerEvent ev;
    std::vector<std::shared_ptr<Subscription> > targets;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        ev.id = generate_uuid();
        ev.sequence = ++sequence_;
        ev.type = draft.type;
        ev.scope = draft.scope.empty() ? "global" : draft.scope;
        ev.direction = draft.direction;
        ev.payload = draft.payload;
        ev.created_at = now_ms();
        if (draft.deliver && options_.deliveries) {
            ev.has_delivery = true;
            ev.delivery.max_attempts = draft.max_attempts > 0
                ? draft.max_attempts : options_.default_max_attempts;
        }

        ring_.push_back(ev);
        index_[ev.id] = ev.sequence;
        while (ring_.size() > options_.backlog) {
            index_.erase(ring_.front().id);
            ring_.pop_front();
        }

        std::vector<std::weak_ptr<Subscription> >::iterator it = subscriptions_.begin();
        while (it != subscriptions_.end()) {
            std::shared_ptr<Subscription> sub = it->lock();
            if (!sub || sub->closed()) {
                it = subscriptions_.erase(it);
                continue;
            }
            targets.push_back(sub);
            ++it;
        }
        listeners = listeners_;
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        if (!targets[i]->filter().matches(ev)) continue;
        if (!targets[i]->offer(ev)) {
            LOG_WARN("broker.subscriber.overflow sub=%s seq=%lld",
                     targets[i]->id().c_str(), static_cast<long long>(ev.sequence));
            targets[i]->close("overflow");
        }
    }

    for (size_t i = 0; i < listeners.size(); ++i) {
        try {
            listeners[i](ev);
        } catch (const std::exception& e) {
            LOG_ERROR("broker.listener.error seq=%lld: %s",
                      static_cast<long long>(ev.sequence), e.what());
        }
    }

    LOG_DEBUG("broker.append seq=%lld type=%s scope=%s",
              static_cast<long long>(ev.sequence), ev.type.c_str(), ev.scope.c_str());
    return ev;
}

std::shared_ptr<Subscription> EventBroker::subscribe(const std::string& last_event_id,
                                                     const EventFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::shared_ptr<Subscription> sub = std::make_shared<Subscription>(
        "sub-" + std::to_string(++next_subscription_), filter, options_.subscriber_queue);

    int64_t after = 0;
    if (!last_event_id.empty()) {
        std::map<std::string, int64_t>::const_iterator found = index_.find(last_event_id);
        if (found != index_.end()) {
            after = found->second;
        }
    }

    size_t replayed = 0;
    for (std::deque<BrokerEvent>::const_iterator it = ring_.begin(); it != ring_.end(); ++it) {
        if (it->sequence <= after || !filter.matches(*it)) continue;
        sub->preload(*it);
        ++replayed;
    }

    subscriptions_.push_back(sub);
    LOG_INFO("broker.subscribe sub=%s after=%lld replay=%zu",
             sub->id().c_str(), static_cast<long long>(after), replayed);
    return sub;
}

void EventBroker::unsubscribe(const std::shared_ptr<Subscription>& sub) {
    if (!sub) return;
    sub->close("unsubscribed");

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::weak_ptr<Subscription> >::iterator it = subscriptions_.begin();
    while (it != subscriptions_.end()) {
        std::shared_ptr<Subscription> current = it->lock();
        if (!current || current == sub) {
            it = subscriptions_.erase(it);
        } else {
            ++it;
        }
    }
}

void EventBroker::add_listener(const Listener& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(listener);
}

AckOutcome EventBroker::ack(const std::vector<std::string>& ids, const std::string& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    AckOutcome outcome;

    for (size_t i = 0; i < ids.size(); ++i) {
        std::map<std::string, int64_t>::const_iterator found = index_.find(ids[i]);
        if (found == index_.end()) {
            outcome.missing.push_back(ids[i]);
            continue;
        }
        BrokerEvent& ev = ring_[static_cast<size_t>(found->second - ring_.front().sequence)];
        if (!scope.empty() && ev.scope != scope) {
            outcome.missing.push_back(ids[i]);
            continue;
        }
        if (!ev.acknowledged) {
            ev.acknowledged = true;
            outcome.acknowledged.push_back(ids[i]);
        }
    }

    if (!outcome.acknowledged.empty()) {
        last_ack_at_ = now_ms();
    }
    return outcome;
}

std::vector<BrokerEvent> EventBroker::list(const ListQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t limit = static_cast<size_t>(clamp_limit(query.limit));

    int64_t after = 0;
    if (!query.after.empty()) {
        std::map<std::string, int64_t>::const_iterator found = index_.find(query.after);
        if (found != index_.end()) after = found->second;
    }

    std::vector<BrokerEvent> out;
    for (std::deque<BrokerEvent>::const_iterator it = ring_.begin();
         it != ring_.end() && out.size() < limit; ++it) {
        if (it->acknowledged || it->sequence <= after) continue;
        if (!query.filter.matches(*it)) continue;
        out.push_back(*it);
    }
    return out;
}

std::vector<BrokerEvent> EventBroker::recent(int limit, const EventFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t max = static_cast<size_t>(clamp_limit(limit));

    std::vector<BrokerEvent> out;
    for (std::deque<BrokerEvent>::const_reverse_iterator it = ring_.rbegin();
         it != ring_.rend() && out.size() < max; ++it) {
        if (filter.matches(*it)) out.push_back(*it);
    }
    return out;
}

bool EventBroker::find(const std::string& id, BrokerEvent& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, int64_t>::const_iterator found = index_.find(id);
    if (found == index_.end()) return false;
    out = ring_[static_cast<size_t>(found->second - ring_.front().sequence)];
    return true;
}

bool EventBroker::update_delivery(const std::string& id, const DeliveryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, int64_t>::const_iterator found = index_.find(id);
    if (found == index_.end()) return false;

    BrokerEvent& ev = ring_[static_cast<size_t>(found->second - ring_.front().sequence)];
    ev.has_delivery = true;
    ev.delivery = record;
    return true;
}

BrokerMetrics EventBroker::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BrokerMetrics m;
    m.total = static_cast<int64_t>(ring_.size());
    for (std::deque<BrokerEvent>::const_iterator it = ring_.begin(); it != ring_.end(); ++it) {
        if (!it->acknowledged) ++m.pending;
    }
    m.last_event_at = ring_.empty() ? 0 : ring_.back().created_at;
    m.last_ack_at = last_ack_at_;
    m.last_sequence = sequence_;
    return m;
}

size_t EventBroker::subscribers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t live = 0;
    for (size_t i = 0; i < subscriptions_.size(); ++i) {
        std::shared_ptr<Subscription> sub = subscriptions_[i].lock();
        if (sub && !sub->closed()) ++live;
    }
    return live;
}

void EventBroker::close_all(const std::string& reason) {
    std::vector<std::shared_ptr<Subscription> > subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < subscriptions_.size(); ++i) {
            std::shared_ptr<Subscription> sub = subscriptions_[i].lock();
            if (sub) subs.push_back(sub);
        }
        subscriptions_.clear();
    }
    for (size_t i = 0; i < subs.size(); ++i) {
        subs[i]->close(reason);
    }
}

} // namespace chatgate
