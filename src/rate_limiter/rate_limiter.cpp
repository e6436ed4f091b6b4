#include <chatgate/rate_limiter/rate_limiter.hpp>
#include <algorithm>

namespace chatgate {

// ============ RateWindow ============

RateWindow::RateWindow(int max_sends, int64_t window_ms)
    : max_sends_(max_sends > 0 ? max_sends : 1)
    , window_ms_(window_ms > 0 ? window_ms : 1) {}

void RateWindow::prune(int64_t now_ms) {
    int64_t cutoff = now_ms - window_ms_;
    while (!timestamps_.empty() && timestamps_.front() <= cutoff) {
        timestamps_.pop_front();
    }
}

RateLimitResult RateWindow::try_acquire(int64_t now_ms) {
    prune(now_ms);

    int current = static_cast<int>(timestamps_.size());
    if (current < max_sends_) {
        timestamps_.push_back(now_ms);
        return RateLimitResult::allow(max_sends_ - current - 1, max_sends_);
    }

    int64_t wait_ms = (timestamps_.front() + window_ms_) - now_ms;
    return RateLimitResult::deny(std::max(wait_ms, static_cast<int64_t>(1)), max_sends_);
}

int RateWindow::in_window(int64_t now_ms) {
    prune(now_ms);
    return static_cast<int>(timestamps_.size());
}

void RateWindow::reset() {
    timestamps_.clear();
}

// ============ IdempotencyGuard ============

IdempotencyGuard::IdempotencyGuard(int64_t window_ms)
    : window_ms_(window_ms)
    , last_cleanup_ms_(0) {}

bool IdempotencyGuard::first_seen(const std::string& key, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (now_ms - last_cleanup_ms_ >= window_ms_ / 10) {
        cleanup(now_ms);
        last_cleanup_ms_ = now_ms;
    }

    std::map<std::string, int64_t>::iterator it = seen_.find(key);
    if (it != seen_.end() && now_ms - it->second < window_ms_) {
        return false;
    }
    seen_[key] = now_ms;
    return true;
}

void IdempotencyGuard::cleanup(int64_t now_ms) {
    std::map<std::string, int64_t>::iterator it = seen_.begin();
    while (it != seen_.end()) {
        if (now_ms - it->second >= window_ms_) {
            seen_.erase(it++);
        } else {
            ++it;
        }
    }
}

size_t IdempotencyGuard::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

void IdempotencyGuard::set_window(int64_t window_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_ms_ = window_ms;
}

} // namespace chatgate
