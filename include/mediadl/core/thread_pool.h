#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace mediadl::core {

/**
 * Fixed-size worker pool for fire-and-forget tasks.
 *
 * The transfer queue sizes it to its concurrency limit; a dispatched transfer waits at most
 * for a worker that is returning from a finished transfer.
 */
class ThreadPool {
public:
    /**
     * @param num_threads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(std::size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a task.
     * @return false if the pool is stopping and the task was dropped
     */
    bool enqueue_detached(std::function<void()> task);

    /**
     * Reject new tasks, let the workers drain the queue and join them.
     * Idempotent. Must not be called from a worker.
     */
    void stop();

    std::size_t queue_size() const;
    std::size_t busy_count() const;
    std::size_t thread_count() const noexcept { return thread_count_; }
    bool is_stopping() const;

private:
    void run(std::stop_token token);

    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::deque<std::function<void()>> tasks_;
    std::size_t busy_{0};
    bool stopping_{false};

    std::size_t thread_count_{0};
    std::vector<std::jthread> workers_;
};

} // namespace mediadl::core
