/*
 * chatgate - Timer thread implementation
 */
#include <chatgate/core/scheduler.hpp>
#include <chatgate/core/logger.hpp>
#include <chatgate/core/utils.hpp>
#include <stdexcept>

namespace chatgate {

TimerScheduler::TimerScheduler()
    : next_id_(1)
    , running_id_(0)
    , stopping_(false) {
    thread_ = std::thread([this] { run(); });
}

TimerScheduler::~TimerScheduler() {
    stop();
}

int64_t TimerScheduler::now_ms() const {
    return current_timestamp_ms();
}

TimerId TimerScheduler::schedule(int64_t delay_ms, std::function<void()> fn) {
    return add(delay_ms, 0, std::move(fn));
}

TimerId TimerScheduler::schedule_every(int64_t interval_ms, std::function<void()> fn) {
    if (interval_ms <= 0) {
        throw std::invalid_argument("schedule_every: interval must be positive");
    }
    return add(interval_ms, interval_ms, std::move(fn));
}

TimerId TimerScheduler::add(int64_t delay_ms, int64_t interval_ms, std::function<void()> fn) {
    if (delay_ms < 0) delay_ms = 0;
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        Timer timer;
        timer.due = Clock::now() + std::chrono::milliseconds(delay_ms);
        timer.interval_ms = interval_ms;
        timer.fn = std::move(fn);
        queue_.insert(std::make_pair(timer.due, id));
        timers_[id] = std::move(timer);
    }
    wakeup_.notify_one();
    return id;
}

bool TimerScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<TimerId, Timer>::iterator it = timers_.find(id);
    if (it == timers_.end()) {
        // A repeating timer that is executing right now must not be re-armed
        if (running_id_ == id) {
            running_id_ = 0;
            return true;
        }
        return false;
    }

    std::pair<std::multimap<Clock::time_point, TimerId>::iterator,
              std::multimap<Clock::time_point, TimerId>::iterator> range =
        queue_.equal_range(it->second.due);
    for (std::multimap<Clock::time_point, TimerId>::iterator q = range.first; q != range.second; ++q) {
        if (q->second == id) {
            queue_.erase(q);
            break;
        }
    }
    timers_.erase(it);
    return true;
}

size_t TimerScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        timers_.clear();
        queue_.clear();
    }
    wakeup_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void TimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            wakeup_.wait(lock);
            continue;
        }

        Clock::time_point due = queue_.begin()->first;
        if (Clock::now() < due) {
            wakeup_.wait_until(lock, due);
            continue;
        }

        TimerId id = queue_.begin()->second;
        queue_.erase(queue_.begin());
        std::map<TimerId, Timer>::iterator it = timers_.find(id);
        if (it == timers_.end()) continue;

        Timer timer = std::move(it->second);
        timers_.erase(it);
        running_id_ = id;

        lock.unlock();
        try {
            timer.fn();
        } catch (const std::exception& e) {
            LOG_ERROR("scheduler.timer.failed id=%llu error=%s",
                      static_cast<unsigned long long>(id), e.what());
        }
        lock.lock();

        // Re-arm unless cancel() cleared running_id_ meanwhile
        if (timer.interval_ms > 0 && running_id_ == id && !stopping_) {
            timer.due = Clock::now() + std::chrono::milliseconds(timer.interval_ms);
            queue_.insert(std::make_pair(timer.due, id));
            timers_[id] = std::move(timer);
        }
        running_id_ = 0;
    }
}

} // namespace chatgate
