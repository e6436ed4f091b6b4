/*
 * chatgate - Timers
 *
 * Reconnect backoff, QR expiry, ack deadlines, the status sweep and
 * webhook retries are all scheduled through this interface. Owners keep
 * the TimerId and cancel it when they stop.
 */
#ifndef CHATGATE_CORE_SCHEDULER_HPP
#define CHATGATE_CORE_SCHEDULER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>

namespace chatgate {

typedef uint64_t TimerId;

class Scheduler {
public:
    virtual ~Scheduler() {}

    // Wall clock in Unix epoch milliseconds
    virtual int64_t now_ms() const = 0;

    // Run fn once after delay_ms. Callbacks run on the scheduler's own
    // thread and must not block; hand slow work to a ThreadPool.
    virtual TimerId schedule(int64_t delay_ms, std::function<void()> fn) = 0;

    // Run fn every interval_ms until cancelled; the id stays the same
    virtual TimerId schedule_every(int64_t interval_ms, std::function<void()> fn) = 0;

    // True if the timer was still pending. Cancelling an unknown or
    // already-fired id is a no-op.
    virtual bool cancel(TimerId id) = 0;
};

// Production scheduler backed by one timer thread
class TimerScheduler : public Scheduler {
public:
    TimerScheduler();
    virtual ~TimerScheduler();

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    virtual int64_t now_ms() const;
    virtual TimerId schedule(int64_t delay_ms, std::function<void()> fn);
    virtual TimerId schedule_every(int64_t interval_ms, std::function<void()> fn);
    virtual bool cancel(TimerId id);

    size_t pending() const;
    void stop();

private:
    typedef std::chrono::steady_clock Clock;

    struct Timer {
        Clock::time_point due;
        int64_t interval_ms;      // 0 for one-shot timers
        std::function<void()> fn;
    };

    TimerId add(int64_t delay_ms, int64_t interval_ms, std::function<void()> fn);
    void run();

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::map<TimerId, Timer> timers_;
    std::multimap<Clock::time_point, TimerId> queue_;
    TimerId next_id_;
    TimerId running_id_;
    bool stopping_;
    std::thread thread_;
};

} // namespace chatgate

#endif // CHATGATE_CORE_SCHEDULER_HPP
