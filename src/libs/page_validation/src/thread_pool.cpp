#include <page_validation/thread_pool.hpp>
#include <algorithm>
#include <stdexcept>

namespace page_validation {

ThreadPool::ThreadPool(std::size_t workers)
    : queue_(std::make_shared<Queue>())
{
    workers = std::max<std::size_t>(workers, 1);
    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i)
        workers_.emplace_back(&ThreadPool::run, queue_);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard lock(queue_->mutex);
        if (queue_->stopped) return;
        queue_->stopped = true;
        dropped.swap(queue_->tasks);
    }
    queue_->ready.notify_all();
    for (auto& worker : workers_)
        worker.detach();
}

bool ThreadPool::stopped() const {
    std::lock_guard lock(queue_->mutex);
    return queue_->stopped;
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard lock(queue_->mutex);
        if (queue_->stopped) throw std::runtime_error("validation pool is stopped");
        queue_->tasks.push_back(std::move(task));
    }
    queue_->ready.notify_one();
}

void ThreadPool::run(std::shared_ptr<Queue> queue) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue->mutex);
            queue->ready.wait(lock, [&queue]() { return queue->stopped || !queue->tasks.empty(); });
            if (queue->stopped) return;
            task = std::move(queue->tasks.front());
            queue->tasks.pop_front();
        }
        task();
    }
}

} // namespace page_validation
