// tests/test_thread_pool.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

#include "chunkvault/thread_pool.hpp"

using ChunkVault::Concurrency::ThreadPool;

TEST(ThreadPoolTest, ReturnsResultsThroughFutures)
{
    ThreadPool pool(3, "test");
    EXPECT_EQ(pool.size(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i)
    {
        results.push_back(pool.enqueue([](int x)
                                       { return x * x; },
                                       i));
    }
    for (int i = 0; i < 20; ++i)
    {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, NeverRunsMoreTasksThanWorkers)
{
    ThreadPool pool(2, "bounded");
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> results;
    for (int i = 0; i < 12; ++i)
    {
        results.push_back(pool.enqueue([&running, &peak]()
                                       {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running; }));
    }
    for (auto &result : results)
    {
        result.get();
    }
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(ThreadPoolTest, PropagatesExceptions)
{
    ThreadPool pool(1, "throwing");
    auto result = pool.enqueue([]() -> int
                               { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);

    // The worker survives a throwing task
    EXPECT_EQ(pool.enqueue([]()
                           { return 7; })
                  .get(),
              7);
}
