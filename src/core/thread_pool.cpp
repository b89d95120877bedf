#include <mediadl/core/thread_pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace mediadl::core {

ThreadPool::ThreadPool(std::size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    thread_count_ = num_threads;
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token token) { run(std::move(token)); });
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::enqueue_detached(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    wake_.notify_one();
    return true;
}

void ThreadPool::stop() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    wake_.notify_all();
    // jthread joins on destruction; queued tasks are drained first
    workers.clear();
}

std::size_t ThreadPool::queue_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::size_t ThreadPool::busy_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

bool ThreadPool::is_stopping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

void ThreadPool::run(std::stop_token token) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, token, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            // Stop requested (or pool stopping) with nothing left to run
            return;
        }

        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        ++busy_;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            // Tasks report their own failures; this only keeps the worker alive
            spdlog::error("ThreadPool: task threw: {}", e.what());
        } catch (...) {
            spdlog::error("ThreadPool: task threw a non-standard exception");
        }

        lock.lock();
        --busy_;
    }
}

} // namespace mediadl::core
