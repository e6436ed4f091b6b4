/*
 * chatgate - Worker pool implementation
 */
#include <chatgate/core/thread_pool.hpp>
#include <chatgate/core/logger.hpp>
#include <stdexcept>

namespace chatgate {

// ============ ThreadPool ============

ThreadPool::ThreadPool(size_t num_threads) : stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("pool.started workers=%zu", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("pool.enqueue.rejected reason=stopped");
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }

    condition_.notify_all();

    for (size_t i = 0; i < threads_.size(); ++i) {
        if (threads_[i].joinable()) {
            threads_[i].join();
        }
    }
    LOG_DEBUG("pool.stopped");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("pool.task.failed error=%s", e.what());
        }
    }
}

// ============ SerialQueue ============

SerialQueue::SerialQueue(ThreadPool& pool, size_t limit)
    : state_(std::make_shared<State>(&pool, limit)) {}

bool SerialQueue::post(std::function<void()> task) {
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->tasks.size() >= state_->limit) {
            return false;
        }
        state_->tasks.push_back(std::move(task));
        if (!state_->running) {
            state_->running = true;
            start = true;
        }
    }

    if (start) {
        std::shared_ptr<State> state = state_;
        if (!state->pool->enqueue([state] { drain(state); })) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->tasks.pop_back();
            state->running = false;
            return false;
        }
    }
    return true;
}

size_t SerialQueue::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->tasks.size();
}

void SerialQueue::drain(std::shared_ptr<State> state) {
    while (true) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->tasks.empty()) {
                state->running = false;
                return;
            }
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("serial_queue.task.failed error=%s", e.what());
        }
    }
}

} // namespace chatgate
