#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace retrace::core {

// Thrown by submit() once shutdown() has begun
class PoolStopped : public std::runtime_error {
public:
    PoolStopped() : std::runtime_error("worker pool is shut down") {}
};

// Fixed set of worker threads draining one FIFO queue. Jobs already queued
// when shutdown() is called still run before the workers exit.
class ThreadPool {
public:
    explicit ThreadPool(size_t workers);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a nullary job; its result or exception arrives through the future
    template<typename F>
    std::future<std::invoke_result_t<F>> submit(F&& job);

    size_t size() const { return workers_.size(); }
    size_t pending() const;

    // Safe to call more than once and from the destructor
    void shutdown();

private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::once_flag joined_;

    void run_worker();
};

template<typename F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& job) {
    using R = std::invoke_result_t<F>;

    // std::function needs a copyable target, so the task lives behind a shared_ptr
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
    auto future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw PoolStopped();
        }
        queue_.emplace_back([task] { (*task)(); });
    }
    wake_.notify_one();
    return future;
}

}  // namespace retrace::core
