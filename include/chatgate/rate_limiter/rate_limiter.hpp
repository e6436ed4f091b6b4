#ifndef CHATGATE_RATE_LIMITER_RATE_LIMITER_HPP
#define CHATGATE_RATE_LIMITER_RATE_LIMITER_HPP

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <cstdint>

namespace chatgate {

struct RateLimitResult {
    bool allowed;
    int64_t retry_after_ms;    // Until the oldest send leaves the window
    int remaining;             // Sends left in the current window
    int limit;

    RateLimitResult()
        : allowed(true)
        , retry_after_ms(0)
        , remaining(0)
        , limit(0) {}

    static RateLimitResult allow(int remaining, int limit) {
        RateLimitResult r;
        r.remaining = remaining;
        r.limit = limit;
        return r;
    }

    static RateLimitResult deny(int64_t retry_after, int limit) {
        RateLimitResult r;
        r.allowed = false;
        r.retry_after_ms = retry_after;
        r.limit = limit;
        return r;
    }
};

// Per-session sliding window of send timestamps used as an admission check.
// Timestamps older than window_ms are pruned lazily on each call. A rejected
// attempt is not recorded and not queued. Not synchronized: the owning
// session serializes access.
class RateWindow {
public:
    RateWindow(int max_sends = 20, int64_t window_ms = 15000);

    // Records now_ms on acceptance
    RateLimitResult try_acquire(int64_t now_ms);

    bool allow(int64_t now_ms) { return try_acquire(now_ms).allowed; }

    // Sends currently inside the window
    int in_window(int64_t now_ms);

    int max_sends() const { return max_sends_; }
    int64_t window_ms() const { return window_ms_; }

    void reset();

private:
    void prune(int64_t now_ms);

    int max_sends_;
    int64_t window_ms_;
    std::deque<int64_t> timestamps_;
};

// Remembers idempotency keys of inbound webhooks for window_ms so that a
// redelivered request is recognized and not processed twice.
class IdempotencyGuard {
public:
    explicit IdempotencyGuard(int64_t window_ms = 10 * 60 * 1000);

    // True the first time a key is seen inside the window
    bool first_seen(const std::string& key, int64_t now_ms);

    size_t size() const;
    void set_window(int64_t window_ms);

private:
    void cleanup(int64_t now_ms);

    mutable std::mutex mutex_;
    int64_t window_ms_;
    std::map<std::string, int64_t> seen_;
    int64_t last_cleanup_ms_;
};

} // namespace chatgate

#endif // CHATGATE_RATE_LIMITER_RATE_LIMITER_HPP
