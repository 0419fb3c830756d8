#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace page_validation {

// Fixed set of workers for render comparisons and asset probes.
// Stopping never waits on a task in flight: queued tasks are dropped and busy workers are
// released to finish on their own.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t workers);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is stopped.
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F task);

    std::size_t size() const { return workers_.size(); }

    // Futures of dropped tasks report std::future_errc::broken_promise.
    void stop();
    bool stopped() const;

private:
    struct Queue {
        mutable std::mutex mutex;
        std::condition_variable ready;
        std::deque<std::function<void()>> tasks;
        bool stopped = false;
    };

    static void run(std::shared_ptr<Queue> queue);
    void enqueue(std::function<void()> task);

    // Shared with the workers so a released worker never outlives its queue.
    std::shared_ptr<Queue> queue_;
    std::vector<std::thread> workers_;
};

template <typename F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F task) {
    using Result = std::invoke_result_t<F>;
    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(task));
    auto future = packaged->get_future();
    enqueue([packaged]() { (*packaged)(); });
    return future;
}

} // namespace page_validation
