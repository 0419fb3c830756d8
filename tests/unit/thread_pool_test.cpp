#include <page_validation/thread_pool.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace page_validation;

TEST(ThreadPoolTest, ReturnsResults) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
    auto sum = pool.submit([] { return 2 + 3; });
    EXPECT_EQ(sum.get(), 5);
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, RunsEveryTaskBeforeStop) {
    std::atomic<int> counter{0};
    ThreadPool pool(3);
    std::vector<std::future<void>> done;
    for (int i = 0; i < 50; ++i) done.push_back(pool.submit([&counter] { counter++; }));
    for (auto& f : done) f.get();
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, StopDropsQueuedTasks) {
    ThreadPool pool(1);
    std::promise<void> release;
    auto gate = release.get_future().share();
    auto began = std::make_shared<std::promise<void>>();
    auto busy = pool.submit([gate, began] { began->set_value(); gate.wait(); return 1; });
    began->get_future().wait();
    auto queued = pool.submit([] { return 2; });

    pool.stop();
    EXPECT_TRUE(pool.stopped());
    try {
        queued.get();
        FAIL() << "queued task ran after stop";
    } catch (const std::future_error& e) {
        EXPECT_EQ(e.code(), std::future_errc::broken_promise);
    }
    EXPECT_THROW(pool.submit([] { return 1; }), std::runtime_error);

    // The task in flight still completes on its released worker.
    release.set_value();
    EXPECT_EQ(busy.get(), 1);
}

TEST(ThreadPoolTest, DestructionDoesNotWaitForRunningTask) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    auto began = std::make_shared<std::promise<void>>();
    auto began_future = began->get_future();
    std::future<int> running;
    std::chrono::steady_clock::time_point started;
    {
        ThreadPool pool(1);
        running = pool.submit([gate, began] { began->set_value(); gate.wait(); return 3; });
        began_future.wait();
        started = std::chrono::steady_clock::now();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
    release.set_value();
    EXPECT_EQ(running.get(), 3);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("render failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}
