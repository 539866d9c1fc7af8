#include <gtest/gtest.h>
#include "psa/utils/parallel.hpp"
#include <atomic>

using namespace psa::parallel;

TEST(ThreadPoolTest, DefaultSizeIsPositive) {
    ThreadPool pool;
    EXPECT_GE(pool.size(), 1u);
}

TEST(ThreadPoolTest, SubmitReturnsFuture) {
    ThreadPool pool(2);
    auto future = pool.submit([](const int a, const int b) { return a + b; }, 2, 3);

    EXPECT_EQ(future.get(), 5);
}

TEST(ThreadPoolTest, RunsEveryTask) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(4);
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 100; ++i) {
            futures.push_back(pool.submit([&counter] { ++counter; }));
        }
        for (auto& future : futures) {
            future.get();
        }
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(ParallelMapTest, PreservesOrder) {
    ThreadPool pool(3);
    std::vector<int> items;
    for (int i = 0; i < 50; ++i) items.push_back(i);

    const auto squares = map(items, [](const int x) { return x * x; }, pool);

    ASSERT_EQ(squares.size(), items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(squares[i], items[i] * items[i]);
    }
}

TEST(ParallelMapTest, PropagatesExceptions) {
    ThreadPool pool(2);
    const std::vector<int> items{1, 2, 3};

    EXPECT_THROW((void)map(items, [](const int x) {
        if (x == 2) throw std::runtime_error("boom");
        return x;
    }, pool), std::runtime_error);
}
