#ifndef CHATGATE_TESTS_MANUAL_SCHEDULER_HPP
#define CHATGATE_TESTS_MANUAL_SCHEDULER_HPP

#include <chatgate/core/scheduler.hpp>

#include <map>
#include <mutex>
#include <functional>

namespace chatgate {
namespace testing {

// Scheduler whose clock only moves when the test advances it. Callbacks
// run on the advancing thread, outside the scheduler lock.
class ManualScheduler : public Scheduler {
public:
    explicit ManualScheduler(int64_t start_ms = 1700000000000LL)
        : now_(start_ms), next_id_(1) {}

    int64_t now_ms() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    TimerId schedule(int64_t delay_ms, std::function<void()> fn) {
        return add(delay_ms, 0, fn);
    }

    TimerId schedule_every(int64_t interval_ms, std::function<void()> fn) {
        return add(interval_ms, interval_ms, fn);
    }

    bool cancel(TimerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.erase(id) > 0;
    }

    // Moves the clock forward, firing every timer that comes due in order
    void advance(int64_t ms) {
        int64_t target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = now_ + ms;
        }
        for (;;) {
            std::function<void()> fn;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                std::map<TimerId, Timer>::iterator due = timers_.end();
                for (std::map<TimerId, Timer>::iterator it = timers_.begin(); it != timers_.end(); ++it) {
                    if (it->second.due > target) continue;
                    if (due == timers_.end() || it->second.due < due->second.due) due = it;
                }
                if (due == timers_.end()) {
                    now_ = target;
                    return;
                }
                if (due->second.due > now_) now_ = due->second.due;
                fn = due->second.fn;
                if (due->second.interval > 0) {
                    due->second.due += due->second.interval;
                } else {
                    timers_.erase(due);
                }
            }
            fn();
        }
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.size();
    }

    // Delay of the earliest pending timer, -1 when none
    int64_t next_delay() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t best = -1;
        for (std::map<TimerId, Timer>::const_iterator it = timers_.begin(); it != timers_.end(); ++it) {
            int64_t d = it->second.due - now_;
            if (best < 0 || d < best) best = d;
        }
        return best;
    }

private:
    struct Timer {
        int64_t due;
        int64_t interval;
        std::function<void()> fn;
    };

    TimerId add(int64_t delay_ms, int64_t interval_ms, std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        Timer t;
        t.due = now_ + (delay_ms > 0 ? delay_ms : 0);
        t.interval = interval_ms;
        t.fn = fn;
        TimerId id = next_id_++;
        timers_[id] = t;
        return id;
    }

    mutable std::mutex mutex_;
    int64_t now_;
    TimerId next_id_;
    std::map<TimerId, Timer> timers_;
};

} // namespace testing
} // namespace chatgate

#endif // CHATGATE_TESTS_MANUAL_SCHEDULER_HPP
