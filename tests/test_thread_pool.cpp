#include <gtest/gtest.h>
#include "../src/core/ThreadPool.h"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

namespace link_scope {

class ThreadPoolTest : public ::testing::Test {};

TEST_F(ThreadPoolTest, RunsTasksAndReturnsResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 50; ++i) futures.push_back(pool.submit([i] { return i * i; }));
    int sum = 0;
    for (auto& f : futures) sum += f.get();
    EXPECT_EQ(sum, 40425);
}

TEST_F(ThreadPoolTest, ZeroThreadsBecomesOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST_F(ThreadPoolTest, ExceptionsTravelThroughFuture) {
    ThreadPool pool(2);
    auto bad = pool.submit([]() -> int { throw std::runtime_error("probe failed"); });
    auto good = pool.submit([] { return 1; });
    EXPECT_THROW(bad.get(), std::runtime_error);
    EXPECT_EQ(good.get(), 1);
}

TEST_F(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 20; ++i) {
            pool.submit([&ran] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++ran;
            });
        }
        pool.shutdown();
    }
    EXPECT_EQ(ran.load(), 20);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_THROW(pool.submit([] { return 0; }), std::runtime_error);
}

} // namespace link_scope
