/*
 * chatgate - Worker pool and per-owner serial queues
 */
#ifndef CHATGATE_CORE_THREAD_POOL_HPP
#define CHATGATE_CORE_THREAD_POOL_HPP

#include <vector>
#include <deque>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <memory>

namespace chatgate {

// Fixed-size pool running socket calls and webhook POSTs
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // False once the pool is shutting down
    bool enqueue(std::function<void()> task);

    size_t size() const { return threads_.size(); }
    size_t pending() const;

    // Runs what is already queued, then joins the workers
    void shutdown();

private:
    void worker();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

// Runs tasks strictly one after another, in post order, on a shared pool.
// Different SerialQueues on the same pool make progress in parallel.
// Tasks already handed to the pool keep the queue state alive, so the
// queue object itself may be destroyed while work is in flight.
class SerialQueue {
public:
    SerialQueue(ThreadPool& pool, size_t limit);

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // False when `limit` tasks are already waiting or the pool is stopped
    bool post(std::function<void()> task);

    size_t pending() const;

private:
    struct State {
        ThreadPool* pool;
        size_t limit;
        std::mutex mutex;
        std::deque<std::function<void()> > tasks;
        bool running;

        State(ThreadPool* p, size_t l) : pool(p), limit(l), running(false) {}
    };

    static void drain(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace chatgate

#endif // CHATGATE_CORE_THREAD_POOL_HPP
