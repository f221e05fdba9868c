// thread_pool.h
#pragma once
#include <functional>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <utility>

/// Fixed set of worker threads draining a FIFO of tasks.
/// The destructor runs every queued task before joining.
class ThreadPool {
public:
    /// @throws std::invalid_argument if num_threads == 0.
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Non-copyable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a callable and return a future for its result.
    template<typename F>
    auto submit(F&& func) -> std::future<decltype(func())>;

    /// Submit every callable and wait for all of them; exceptions are
    /// left inside the returned futures.
    template<typename F>
    std::vector<std::future<decltype(std::declval<F&>()())>> runAll(std::vector<F> funcs);

    // Number of worker threads.
    size_t size() const;

    // Tasks queued but not yet picked up by a worker.
    size_t pending() const;

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

// ── Template implementation (must live in the header) ──────────

template<typename F>
auto ThreadPool::submit(F&& func) -> std::future<decltype(func())> {
    using ReturnType = decltype(func());

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<F>(func));

    std::future<ReturnType> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_.load(std::memory_order_relaxed)) {
            throw std::runtime_error("submit() called on a stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    cv_.notify_one();
    return future;
}

template<typename F>
std::vector<std::future<decltype(std::declval<F&>()())>> ThreadPool::runAll(std::vector<F> funcs) {
    std::vector<std::future<decltype(std::declval<F&>()())>> futures;
    futures.reserve(funcs.size());
    for (auto& f : funcs) {
        futures.push_back(submit(std::move(f)));
    }
    for (auto& f : futures) {
        f.wait();
    }
    return futures;
}
