#include <gtest/gtest.h>

#include "ThreadPool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <mutex>
#include <thread>
#include <vector>

using namespace RelayPipe;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsEveryTask) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.enqueue([&counter]() { counter++; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, UsesSeveralThreads) {
    ThreadPool pool(4);
    std::mutex mutex;
    std::set<std::thread::id> ids;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(pool.enqueue([&]() {
            std::this_thread::sleep_for(20ms);
            std::lock_guard<std::mutex> lock(mutex);
            ids.insert(std::this_thread::get_id());
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_GT(ids.size(), 1u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto f = pool.enqueue([]() { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // The worker survives
    auto g = pool.enqueue([]() {});
    EXPECT_NO_THROW(g.get());
}

TEST(ThreadPoolTest, ShutdownDrainsQueue) {
    ThreadPool pool(1);
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.enqueue([&done]() {
            std::this_thread::sleep_for(2ms);
            done++;
        }));
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, TasksAfterShutdownAreDropped) {
    ThreadPool pool(1);
    pool.shutdown();

    bool ran = false;
    auto f = pool.enqueue([&ran]() { ran = true; });
    try {
        f.get();
        FAIL() << "expected broken promise";
    } catch (const std::future_error& e) {
        EXPECT_EQ(e.code(), std::make_error_code(std::future_errc::broken_promise));
    }
    EXPECT_FALSE(ran);
}

TEST(ThreadPoolTest, FullBacklogRejectsTryPost) {
    ThreadPool pool(1, 2);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    // Occupy the only worker, then fill the backlog
    ASSERT_TRUE(pool.tryPost([&started, gate]() {
        started.set_value();
        gate.wait();
    }).ok());
    started.get_future().wait();

    std::atomic<int> ran{0};
    ASSERT_TRUE(pool.tryPost([&ran]() { ran++; }).ok());
    ASSERT_TRUE(pool.tryPost([&ran]() { ran++; }).ok());
    EXPECT_EQ(pool.pending(), 2u);

    auto refused = pool.tryPost([&ran]() { ran++; });
    ASSERT_FALSE(refused.ok());
    EXPECT_EQ(refused.error().code, ErrorCode::RateLimited);
    EXPECT_TRUE(isRetryable(refused.error().code));
    EXPECT_EQ(pool.rejected(), 1u);

    // enqueue() is not subject to the backlog limit
    auto extra = pool.enqueue([&ran]() { ran++; });

    release.set_value();
    extra.get();
    pool.shutdown();
    EXPECT_EQ(ran.load(), 3);
}

TEST(ThreadPoolTest, TryPostAfterShutdownIsRefused) {
    ThreadPool pool(1);
    pool.shutdown();
    auto refused = pool.tryPost([]() {});
    ASSERT_FALSE(refused.ok());
    EXPECT_EQ(refused.error().code, ErrorCode::ShuttingDown);
    EXPECT_EQ(pool.rejected(), 0u);
}

TEST(ThreadPoolTest, MapOrderedKeepsIndexOrder) {
    ThreadPool pool(4);
    auto squares = pool.mapOrdered<int>(50, [](size_t i) {
        // Later indices finish first
        std::this_thread::sleep_for(std::chrono::microseconds(50 * (50 - i)));
        return static_cast<int>(i * i);
    });
    ASSERT_EQ(squares.size(), 50u);
    for (size_t i = 0; i < squares.size(); ++i) {
        EXPECT_EQ(squares[i], static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, MapOrderedWaitsForAllBeforeRethrowing) {
    ThreadPool pool(3);
    std::atomic<int> finished{0};
    EXPECT_THROW(pool.mapOrdered<int>(12, [&finished](size_t i) {
        std::this_thread::sleep_for(2ms);
        finished++;
        if (i == 3) {
            throw std::runtime_error("bad piece");
        }
        return static_cast<int>(i);
    }), std::runtime_error);
    EXPECT_EQ(finished.load(), 12);
}

TEST(ThreadPoolTest, MapOrderedOnStoppedPoolThrows) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_THROW(pool.mapOrdered<int>(3, [](size_t i) { return static_cast<int>(i); }), std::runtime_error);
    EXPECT_TRUE(pool.mapOrdered<int>(0, [](size_t i) { return static_cast<int>(i); }).empty());
}
