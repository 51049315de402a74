// tests/test_worker_pool.cpp
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

#include "util/worker_pool.hpp"

using namespace std::chrono_literals;

TEST(WorkerPool, RunsEveryTaskBeforeIdle)
{
    bluest::WorkerPool pool(5);
    EXPECT_EQ(pool.size(), 5u);

    std::atomic<int> n{0};
    for (int i = 0; i < 100; ++i)
        ASSERT_TRUE(pool.submit([&] { ++n; }));
    pool.wait_idle();
    EXPECT_EQ(n.load(), 100);
}

TEST(WorkerPool, SlowTaskDoesNotBlockOthers)
{
    bluest::WorkerPool pool(2);
    std::atomic<bool>  release{false};
    std::atomic<bool>  fast_done{false};

    pool.submit([&] {
        while (!release.load())
            std::this_thread::sleep_for(1ms);
    });
    pool.submit([&] { fast_done.store(true); });

    for (int i = 0; i < 500 && !fast_done.load(); ++i)
        std::this_thread::sleep_for(1ms);
    EXPECT_TRUE(fast_done.load());
    release.store(true);
    pool.wait_idle();
}

TEST(WorkerPool, ThrowingTaskIsIsolated)
{
    bluest::WorkerPool pool(1);
    std::atomic<int>   n{0};

    testing::internal::CaptureStderr();
    pool.submit([] { throw std::runtime_error("listener exploded"); });
    pool.submit([&] { ++n; });
    pool.wait_idle();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(n.load(), 1);
    EXPECT_NE(err.find("listener exploded"), std::string::npos);
}

TEST(WorkerPool, NonStdThrowIsIsolated)
{
    bluest::WorkerPool pool(1);
    std::atomic<int>   n{0};

    testing::internal::CaptureStderr();
    pool.submit([] { throw 42; });
    pool.submit([&] { ++n; });
    pool.wait_idle();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(n.load(), 1);
    EXPECT_NE(err.find("non-std exception"), std::string::npos);
}

TEST(WorkerPool, WaitIdleFromPoolThreadReturns)
{
    bluest::WorkerPool pool(1);
    std::atomic<bool>  returned{false};
    pool.submit([&] {
        EXPECT_TRUE(pool.on_pool_thread());
        pool.wait_idle();
        returned.store(true);
    });
    pool.wait_idle();
    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(pool.on_pool_thread());
}

TEST(WorkerPool, ShutdownDrainsAndRejects)
{
    bluest::WorkerPool pool(3);
    std::atomic<int>   n{0};
    for (int i = 0; i < 20; ++i)
        pool.submit([&] {
            std::this_thread::sleep_for(1ms);
            ++n;
        });
    pool.shutdown();
    EXPECT_EQ(n.load(), 20);
    EXPECT_FALSE(pool.submit([&] { ++n; }));
    pool.shutdown();  // idempotent
    EXPECT_EQ(n.load(), 20);
}
