/*
 * chatgate - Delivery status ledger
 *
 * Tracks every in-flight outbound message of one session on the status
 * ladder (0 failed, 1 pending, 2 server-ack, 3 delivered, 4 read, 5 played),
 * serves ack waits, keeps per-status counters and ack latency, and bounds
 * memory with a TTL sweep.
 */
#ifndef CHATGATE_STATUS_STATUS_LEDGER_HPP
#define CHATGATE_STATUS_STATUS_LEDGER_HPP

#include <chatgate/core/scheduler.hpp>
#include <chatgate/core/json.hpp>

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <mutex>
#include <future>
#include <memory>
#include <functional>
#include <cstdint>

namespace chatgate {

// Outcome of an ack wait; acked == false means no status arrived in time
struct AckResult {
    bool acked;
    int status;

    AckResult() : acked(false), status(-1) {}

    static AckResult none() { return AckResult(); }
    static AckResult of(int status) {
        AckResult r;
        r.acked = true;
        r.status = status;
        return r;
    }
};

struct AckLatency {
    int64_t total_ms;
    int64_t count;
    int64_t avg_ms;
    int64_t last_ms;

    AckLatency() : total_ms(0), count(0), avg_ms(0), last_ms(0) {}
};

struct TimelinePoint {
    int64_t ts;
    int64_t sent;
    int64_t pending;
    int64_t server_ack;
    int64_t delivered;
    int64_t read;
    int64_t played;
    int64_t failed;
    int64_t rate_in_window;

    TimelinePoint()
        : ts(0), sent(0), pending(0), server_ack(0), delivered(0)
        , read(0), played(0), failed(0), rate_in_window(0) {}

    Json to_json() const;
};

struct LedgerMetrics {
    int64_t status_counts[6];
    AckLatency ack;
    int64_t sent;
    int64_t tracked;
    int64_t finalized;        // entries removed on reaching a terminal status
    int64_t expired;          // entries dropped by the TTL sweep
    std::string last_status_id;
    int last_status_code;
    std::vector<TimelinePoint> timeline;

    LedgerMetrics();

    Json to_json() const;
};

// Emitted after an update has been applied to the ledger
struct StatusChange {
    std::string message_id;
    int status;
    int previous;             // -1 when the id was not tracked
    int64_t latency_ms;       // -1 unless this update closed an ack wait
};

class StatusLedger : public std::enable_shared_from_this<StatusLedger> {
public:
    struct Options {
        int64_t ttl_ms;
        int64_t sweep_interval_ms;
        size_t timeline_max;
        int64_t timeline_min_interval_ms;

        Options()
            : ttl_ms(10 * 60 * 1000)
            , sweep_interval_ms(60 * 1000)
            , timeline_max(288)
            , timeline_min_interval_ms(5 * 60 * 1000) {}
    };

    typedef std::function<void(const StatusChange&)> ChangeListener;

    StatusLedger(Scheduler& scheduler, const Options& options = Options());
    ~StatusLedger();

    StatusLedger(const StatusLedger&) = delete;
    StatusLedger& operator=(const StatusLedger&) = delete;

    // Arms the periodic sweep. Requires the ledger to be owned by a shared_ptr.
    void start();

    // Cancels the sweep and every ack timer; outstanding waits resolve
    // with AckResult::none().
    void stop();

    void set_listener(const ChangeListener& listener);

    // A message left the socket: status 1 and ack clock started.
    // rate_in_window is folded into the metrics timeline.
    void record_dispatch(const std::string& message_id, int rate_in_window = 0);

    // Resolves with the first status observed for message_id after this
    // call (or already observed since dispatch), or with none() once
    // timeout_ms passes. A second call for the same id returns the same wait.
    std::shared_future<AckResult> wait_for_ack(const std::string& message_id, int64_t timeout_ms);

    // Monotonic: an update not above the stored status only refreshes the
    // entry's timestamp; failed (0) always applies. Returns true when the
    // update was applied.
    bool apply(const std::string& message_id, int status);

    // Drops terminal and expired entries; returns how many were removed
    size_t sweep();

    // -1 when the id is not tracked
    int status_of(const std::string& message_id) const;

    LedgerMetrics metrics() const;
    size_t tracked() const;
    size_t waiting() const;

private:
    struct Entry {
        int status;
        int64_t updated_at;
    };

    struct Waiter {
        std::shared_ptr<std::promise<AckResult> > promise;
        std::shared_future<AckResult> future;
        TimerId timer;
    };

    void increment(int status);
    void decrement(int status);
    void remove_entry(std::map<std::string, Entry>::iterator it);
    void snapshot(int64_t now);
    void remember_final(const std::string& id, int status);
    bool recent_final(const std::string& id, int& status) const;

    // Detaches the waiter under lock; caller fulfils the promise afterwards
    bool take_waiter(const std::string& id, Waiter& out);
    void on_ack_timeout(const std::string& id);

    Scheduler& scheduler_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, int64_t> ack_sent_at_;
    std::map<std::string, Waiter> waiters_;
    std::deque<std::pair<std::string, int> > recent_finals_;

    int64_t counts_[6];
    AckLatency ack_;
    int64_t sent_;
    int64_t finalized_;
    int64_t expired_;
    int64_t rate_in_window_;
    std::string last_status_id_;
    int last_status_code_;
    std::deque<TimelinePoint> timeline_;

    TimerId sweep_timer_;
    bool stopped_;
    ChangeListener listener_;
};

} // namespace chatgate

#endif // CHATGATE_STATUS_STATUS_LEDGER_HPP
