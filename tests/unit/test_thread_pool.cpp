#include <gtest/gtest.h>
#include <agentbox/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace agentbox;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsSubmittedJob) {
    ThreadPool pool;
    std::promise<int> done;
    auto future = done.get_future();

    ASSERT_TRUE(pool.Submit([&done]() { done.set_value(7); }));

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get(), 7);
}

TEST(ThreadPoolTest, StartsMinThreadsEagerly) {
    ThreadPool pool(3, 8);
    EXPECT_EQ(pool.GetStats().threads, 3u);
    EXPECT_EQ(pool.MaxThreads(), 8u);
}

TEST(ThreadPoolTest, MaxThreadsClampedToMin) {
    ThreadPool pool(4, 2);
    EXPECT_EQ(pool.MaxThreads(), 4u);

    ThreadPool tiny(0, 0);
    EXPECT_EQ(tiny.MaxThreads(), 1u);
}

TEST(ThreadPoolTest, GrowsWhenAllWorkersBlock) {
    // Each job blocks until all have started; needs one worker per job
    constexpr int kJobs = 6;
    ThreadPool pool(1, 16);

    std::mutex mutex;
    std::condition_variable cv;
    int started = 0;
    std::atomic<int> finished{0};

    for (int i = 0; i < kJobs; ++i) {
        ASSERT_TRUE(pool.Submit([&]() {
            std::unique_lock<std::mutex> lock(mutex);
            ++started;
            cv.notify_all();
            cv.wait_for(lock, 5s, [&]() { return started == kJobs; });
            finished.fetch_add(1);
        }));
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, 5s, [&]() { return started == kJobs; }));
    }

    pool.Shutdown();
    EXPECT_EQ(finished.load(), kJobs);
    EXPECT_EQ(pool.GetStats().jobs_completed, static_cast<uint64_t>(kJobs));
}

TEST(ThreadPoolTest, JobExceptionIsContained) {
    ThreadPool pool(1, 1);
    ASSERT_TRUE(pool.Submit([]() { throw std::runtime_error("job failure"); }));

    std::promise<void> after;
    auto future = after.get_future();
    ASSERT_TRUE(pool.Submit([&after]() { after.set_value(); }));

    // Same single worker survives the throwing job
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);

    pool.Shutdown();
    auto stats = pool.GetStats();
    EXPECT_EQ(stats.jobs_failed, 1u);
    EXPECT_EQ(stats.jobs_completed, 2u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownIsRejected) {
    ThreadPool pool;
    pool.Shutdown();

    EXPECT_TRUE(pool.IsShutdown());
    EXPECT_FALSE(pool.Submit([]() {}));
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedJobs) {
    ThreadPool pool(1, 1);
    std::atomic<int> ran{0};

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool.Submit([&ran]() { ran.fetch_add(1); }));
    }

    pool.Shutdown();
    EXPECT_EQ(ran.load(), 50);
    EXPECT_EQ(pool.GetStats().threads, 0u);
}

TEST(ThreadPoolTest, ShutdownIsIdempotent) {
    ThreadPool pool(2);
    pool.Shutdown();
    pool.Shutdown();
    EXPECT_TRUE(pool.IsShutdown());
}

TEST(ThreadPoolTest, SharedInstanceIsStable) {
    auto& a = ThreadPool::Shared();
    auto& b = ThreadPool::Shared();
    EXPECT_EQ(&a, &b);
    EXPECT_FALSE(a.IsShutdown());
}
