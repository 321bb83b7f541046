#include <gtest/gtest.h>
#include "../include/threadpool.hpp"
#include <atomic>
#include <chrono>

TEST(ThreadPoolTest, RunsEveryTask) {
    ThreadPool pool(4);
    std::atomic<int> counter(0);

    for (int i = 0; i < 200; ++i)
        pool.enqueue([&counter]() { counter++; });

    pool.waitUntilEmpty();
    EXPECT_EQ(counter.load(), 200);
}

TEST(ThreadPoolTest, WaitCoversRunningTasks) {
    ThreadPool pool(2);
    std::atomic<int> done(0);

    for (int i = 0; i < 4; ++i) {
        pool.enqueue([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            done++;
        });
    }

    pool.waitUntilEmpty();
    EXPECT_EQ(done.load(), 4);
}

TEST(ThreadPoolTest, ZeroThreadsStillWorks) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);

    std::atomic<int> counter(0);
    pool.enqueue([&counter]() { counter++; });
    pool.waitUntilEmpty();
    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPoolTest, SharedPoolIsReusable) {
    std::atomic<int> counter(0);

    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 10; ++i)
            getThreadPool().enqueue([&counter]() { counter++; });
        getThreadPool().waitUntilEmpty();
        EXPECT_EQ(counter.load(), (round + 1) * 10);
    }
}
