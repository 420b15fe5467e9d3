#include <gtest/gtest.h>
#include <agentbox/detail/worker_task.hpp>
#include <agentbox/errors.hpp>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace agentbox;
using namespace std::chrono_literals;

TEST(WorkerTaskTest, IdsAreUnique) {
    detail::WorkerTask a;
    detail::WorkerTask b;
    EXPECT_NE(a.Id(), b.Id());
}

TEST(WorkerTaskTest, CompleteWakesWaiter) {
    detail::WorkerTask task;
    EXPECT_FALSE(task.IsDone());

    std::thread worker([&task]() {
        std::this_thread::sleep_for(20ms);
        task.Complete(nullptr);
    });

    task.Wait();
    worker.join();

    EXPECT_TRUE(task.IsDone());
    EXPECT_EQ(task.Failure(), nullptr);
}

TEST(WorkerTaskTest, WaitForTimesOut) {
    detail::WorkerTask task;
    EXPECT_FALSE(task.WaitFor(20ms));
    EXPECT_FALSE(task.IsDone());
}

TEST(WorkerTaskTest, VeryLongWaitForBlocksUntilComplete) {
    detail::WorkerTask task;
    const auto centuries = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::hours(24 * 365 * 400));

    std::thread worker([&task]() {
        std::this_thread::sleep_for(30ms);
        task.Complete(nullptr);
    });

    EXPECT_TRUE(task.WaitFor(centuries));
    worker.join();
}

TEST(WorkerTaskTest, ExitedFlag) {
    detail::WorkerTask task;
    EXPECT_FALSE(task.HasExited());
    task.MarkExited();
    EXPECT_TRUE(task.HasExited());
    EXPECT_FALSE(task.IsDone());
}

TEST(WorkerTaskTest, FirstCompletionWins) {
    detail::WorkerTask task;
    auto failure = std::make_exception_ptr(std::runtime_error("first"));

    EXPECT_TRUE(task.Complete(failure));
    EXPECT_FALSE(task.Complete(nullptr));

    EXPECT_TRUE(task.WaitFor(0ms));
    EXPECT_EQ(Describe(task.Failure()), "first");
}

TEST(WorkerTaskTest, ThreadBinding) {
    detail::WorkerTask task;
    EXPECT_FALSE(task.IsCurrentThread());

    bool on_worker = false;
    std::thread worker([&]() {
        task.BindToCurrentThread();
        on_worker = task.IsCurrentThread();
    });
    worker.join();

    EXPECT_TRUE(on_worker);
    EXPECT_FALSE(task.IsCurrentThread());
}

TEST(WorkerTaskTest, RunScopeStopsOnRequest) {
    detail::WorkerTask task;
    auto token = task.GetStopToken();
    EXPECT_FALSE(token.stop_requested());

    task.RequestStop();
    EXPECT_TRUE(token.stop_requested());
}

TEST(ErrorsTest, CancellationIsRecognized) {
    EXPECT_TRUE(IsCancellation(std::make_exception_ptr(OperationCancelled())));
    EXPECT_FALSE(IsCancellation(std::make_exception_ptr(std::runtime_error("x"))));
    EXPECT_FALSE(IsCancellation(nullptr));
}

TEST(ErrorsTest, DescribeCapturedExceptions) {
    EXPECT_EQ(Describe(std::make_exception_ptr(std::logic_error("bad state"))), "bad state");
    EXPECT_EQ(Describe(std::make_exception_ptr(42)), "non-standard exception");
    EXPECT_EQ(Describe(nullptr), "no error");
}
