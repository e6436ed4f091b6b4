/*
 * chatgate - Delivery status ledger implementation
 */
#include <chatgate/status/status_ledger.hpp>
#include <chatgate/core/types.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>
#include <algorithm>

namespace chatgate {

namespace {

const size_t RECENT_FINALS_MAX = 256;

std::shared_future<AckResult> ready_future(const AckResult& result) {
    std::promise<AckResult> p;
    p.set_value(result);
    return p.get_future().share();
}

bool valid_status(int status) {
    return status >= message_status::FAILED && status <= message_status::PLAYED;
}

} // namespace

// ============ Metrics ============

Json TimelinePoint::to_json() const {
    Json j = Json::object();
    j["ts"] = ts;
    j["iso"] = format_timestamp_ms(ts);
    j["sent"] = sent;
    j["pending"] = pending;
    j["serverAck"] = server_ack;
    j["delivered"] = delivered;
    j["read"] = read;
    j["played"] = played;
    j["failed"] = failed;
    j["rateInWindow"] = rate_in_window;
    return j;
}

LedgerMetrics::LedgerMetrics()
    : sent(0), tracked(0), finalized(0), expired(0), last_status_code(-1) {
    for (int i = 0; i < 6; ++i) status_counts[i] = 0;
}

Json LedgerMetrics::to_json() const {
    Json j = Json::object();
    j["sent"] = sent;
    j["tracked"] = tracked;
    j["finalized"] = finalized;
    j["expired"] = expired;

    Json counts = Json::object();
    for (int i = 0; i < 6; ++i) {
        counts[std::to_string(i)] = status_counts[i];
    }
    j["statusCounts"] = counts;

    Json ack_json = Json::object();
    ack_json["totalMs"] = ack.total_ms;
    ack_json["count"] = ack.count;
    ack_json["avgMs"] = ack.avg_ms;
    ack_json["lastMs"] = ack.last_ms;
    j["ack"] = ack_json;

    Json last = Json::object();
    last["lastStatusId"] = last_status_id.empty() ? Json() : Json(last_status_id);
    last["lastStatusCode"] = last_status_code < 0 ? Json() : Json(last_status_code);
    j["last"] = last;

    Json points = Json::array();
    for (size_t i = 0; i < timeline.size(); ++i) {
        points.push_back(timeline[i].to_json());
    }
    j["timeline"] = points;
    return j;
}

// ============ StatusLedger ============

StatusLedger::StatusLedger(Scheduler& scheduler, const Options& options)
    : scheduler_(scheduler)
    , options_(options)
    , sent_(0)
    , finalized_(0)
    , expired_(0)
    , rate_in_window_(0)
    , last_status_code_(-1)
    , sweep_timer_(0)
    , stopped_(false) {
    for (int i = 0; i < 6; ++i) counts_[i] = 0;
}

StatusLedger::~StatusLedger() {
    stop();
}

void StatusLedger::start() {
    std::weak_ptr<StatusLedger> weak = shared_from_this();
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = false;
    if (sweep_timer_ != 0) return;
    sweep_timer_ = scheduler_.schedule_every(options_.sweep_interval_ms, [weak] {
        std::shared_ptr<StatusLedger> self = weak.lock();
        if (self) self->sweep();
    });
}

void StatusLedger::stop() {
    std::vector<Waiter> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        if (sweep_timer_ != 0) {
            scheduler_.cancel(sweep_timer_);
            sweep_timer_ = 0;
        }
        for (std::map<std::string, Waiter>::iterator it = waiters_.begin(); it != waiters_.end(); ++it) {
            scheduler_.cancel(it->second.timer);
            pending.push_back(it->second);
        }
        waiters_.clear();
    }

    for (size_t i = 0; i < pending.size(); ++i) {
        pending[i].promise->set_value(AckResult::none());
    }
    if (!pending.empty()) {
        LOG_DEBUG("ledger.stop resolved_waiters=%zu", pending.size());
    }
}

void StatusLedger::set_listener(const ChangeListener& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
}

void StatusLedger::increment(int status) {
    if (valid_status(status)) ++counts_[status];
}

void StatusLedger::decrement(int status) {
    if (valid_status(status) && counts_[status] > 0) --counts_[status];
}

void StatusLedger::remove_entry(std::map<std::string, Entry>::iterator it) {
    decrement(it->second.status);
    ack_sent_at_.erase(it->first);
    entries_.erase(it);
}

void StatusLedger::remember_final(const std::string& id, int status) {
    recent_finals_.push_back(std::make_pair(id, status));
    while (recent_finals_.size() > RECENT_FINALS_MAX) {
        recent_finals_.pop_front();
    }
}

bool StatusLedger::recent_final(const std::string& id, int& status) const {
    for (std::deque<std::pair<std::string, int> >::const_reverse_iterator it = recent_finals_.rbegin();
         it != recent_finals_.rend(); ++it) {
        if (it->first == id) {
            status = it->second;
            return true;
        }
    }
    return false;
}

void StatusLedger::snapshot(int64_t now) {
    TimelinePoint point;
    point.ts = now;
    point.sent = sent_;
    point.pending = counts_[message_status::PENDING];
    point.server_ack = counts_[message_status::SERVER_ACK];
    point.delivered = counts_[message_status::DELIVERED];
    point.read = counts_[message_status::READ];
    point.played = counts_[message_status::PLAYED];
    point.failed = counts_[message_status::FAILED];
    point.rate_in_window = rate_in_window_;

    // Within the minimum interval the newest point is refreshed in place
    if (!timeline_.empty() && now - timeline_.back().ts < options_.timeline_min_interval_ms) {
        point.ts = timeline_.back().ts;
        timeline_.back() = point;
        return;
    }

    timeline_.push_back(point);
    while (timeline_.size() > options_.timeline_max) {
        timeline_.pop_front();
    }
}

void StatusLedger::record_dispatch(const std::string& message_id, int rate_in_window) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = scheduler_.now_ms();
    ++sent_;
    rate_in_window_ = rate_in_window;

    int final_status;
    if (recent_final(message_id, final_status)) {
        // The platform confirmed it before we got here
        snapshot(now);
        return;
    }

    std::map<std::string, Entry>::iterator it = entries_.find(message_id);
    if (it == entries_.end()) {
        Entry entry;
        entry.status = message_status::PENDING;
        entry.updated_at = now;
        entries_[message_id] = entry;
        increment(message_status::PENDING);
        ack_sent_at_[message_id] = now;
    } else if (it->second.status <= message_status::PENDING) {
        ack_sent_at_[message_id] = now;
    }
    snapshot(now);
}

std::shared_future<AckResult> StatusLedger::wait_for_ack(const std::string& message_id,
                                                         int64_t timeout_ms) {
    std::weak_ptr<StatusLedger> weak = shared_from_this();
    std::lock_guard<std::mutex> lock(mutex_);

    if (stopped_) {
        return ready_future(AckResult::none());
    }

    std::map<std::string, Waiter>::iterator existing = waiters_.find(message_id);
    if (existing != waiters_.end()) {
        return existing->second.future;
    }

    std::map<std::string, Entry>::const_iterator entry = entries_.find(message_id);
    if (entry != entries_.end() && entry->second.status > message_status::PENDING) {
        return ready_future(AckResult::of(entry->second.status));
    }
    int final_status;
    if (recent_final(message_id, final_status)) {
        return ready_future(AckResult::of(final_status));
    }

    Waiter waiter;
    waiter.promise = std::make_shared<std::promise<AckResult> >();
    waiter.future = waiter.promise->get_future().share();
    waiter.timer = scheduler_.schedule(timeout_ms, [weak, message_id] {
        std::shared_ptr<StatusLedger> self = weak.lock();
        if (self) self->on_ack_timeout(message_id);
    });
    waiters_[message_id] = waiter;
    return waiter.future;
}

bool StatusLedger::take_waiter(const std::string& id, Waiter& out) {
    std::map<std::string, Waiter>::iterator it = waiters_.find(id);
    if (it == waiters_.end()) return false;
    out = it->second;
    waiters_.erase(it);
    return true;
}

void StatusLedger::on_ack_timeout(const std::string& id) {
    Waiter waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!take_waiter(id, waiter)) return;
    }
    LOG_DEBUG("ledger.ack.timeout id=%s", id.c_str());
    waiter.promise->set_value(AckResult::none());
}

bool StatusLedger::apply(const std::string& message_id, int status) {
    if (!valid_status(status)) {
        LOG_WARN("ledger.status.invalid id=%s status=%d", message_id.c_str(), status);
        return false;
    }

    bool applied = false;
    bool resolve = false;
    Waiter waiter;
    StatusChange change;
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = scheduler_.now_ms();

        std::map<std::string, Entry>::iterator it = entries_.find(message_id);
        int previous = it != entries_.end() ? it->second.status : -1;

        // failed sits below pending numerically but still ends a live entry
        bool stale = status != message_status::FAILED && status <= previous;
        int final_status;
        if (it == entries_.end() && recent_final(message_id, final_status)) {
            // Already finalized; a late update must not bring the entry back
            LOG_DEBUG("ledger.status.after_final id=%s status=%d final=%d",
                      message_id.c_str(), status, final_status);
        } else if (it != entries_.end() && stale) {
            it->second.updated_at = now;
        } else {
            applied = true;
            change.message_id = message_id;
            change.status = status;
            change.previous = previous;
            change.latency_ms = -1;

            if (it == entries_.end()) {
                Entry entry;
                entry.status = status;
                entry.updated_at = now;
                it = entries_.insert(std::make_pair(message_id, entry)).first;
            } else {
                decrement(previous);
                it->second.status = status;
                it->second.updated_at = now;
            }
            increment(status);

            last_status_id_ = message_id;
            last_status_code_ = status;

            if (status >= message_status::SERVER_ACK) {
                std::map<std::string, int64_t>::iterator sent_at = ack_sent_at_.find(message_id);
                if (sent_at != ack_sent_at_.end()) {
                    int64_t delta = std::max(static_cast<int64_t>(0), now - sent_at->second);
                    ack_.total_ms += delta;
                    ack_.count += 1;
                    ack_.last_ms = delta;
                    ack_.avg_ms = (ack_.total_ms + ack_.count / 2) / ack_.count;
                    change.latency_ms = delta;
                    ack_sent_at_.erase(sent_at);
                }
            }

            snapshot(now);

            if (message_status::is_terminal(status)) {
                remove_entry(it);
                ++finalized_;
                remember_final(message_id, status);
                snapshot(now);
            }
            listener = listener_;
        }

        resolve = take_waiter(message_id, waiter);
        if (resolve) {
            scheduler_.cancel(waiter.timer);
        }
    }

    if (resolve) {
        waiter.promise->set_value(AckResult::of(status));
    }
    if (applied && listener) {
        listener(change);
    }
    return applied;
}

size_t StatusLedger::sweep() {
    size_t removed = 0;
    size_t expired_now = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = scheduler_.now_ms();

        std::map<std::string, Entry>::iterator it = entries_.begin();
        while (it != entries_.end()) {
            std::map<std::string, Entry>::iterator current = it++;
            bool terminal = message_status::is_terminal(current->second.status);
            bool expired = now - current->second.updated_at >= options_.ttl_ms;
            if (!terminal && !expired) continue;

            if (terminal) {
                ++finalized_;
            } else {
                ++expired_;
                ++expired_now;
            }
            remove_entry(current);
            ++removed;
        }

        // Ack clocks for ids that never got an entry back
        std::map<std::string, int64_t>::iterator sent_at = ack_sent_at_.begin();
        while (sent_at != ack_sent_at_.end()) {
            if (now - sent_at->second >= options_.ttl_ms) {
                ack_sent_at_.erase(sent_at++);
            } else {
                ++sent_at;
            }
        }

        if (removed > 0) snapshot(now);
    }

    if (removed > 0) {
        LOG_DEBUG("ledger.sweep removed=%zu expired=%zu", removed, expired_now);
    }
    return removed;
}

int StatusLedger::status_of(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Entry>::const_iterator it = entries_.find(message_id);
    return it != entries_.end() ? it->second.status : -1;
}

LedgerMetrics StatusLedger::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerMetrics m;
    for (int i = 0; i < 6; ++i) m.status_counts[i] = counts_[i];
    m.ack = ack_;
    m.sent = sent_;
    m.tracked = static_cast<int64_t>(entries_.size());
    m.finalized = finalized_;
    m.expired = expired_;
    m.last_status_id = last_status_id_;
    m.last_status_code = last_status_code_;
    m.timeline.assign(timeline_.begin(), timeline_.end());
    return m;
}

size_t StatusLedger::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t StatusLedger::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

} // namespace chatgate
