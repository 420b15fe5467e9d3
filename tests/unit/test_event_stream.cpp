#include <gtest/gtest.h>
#include <agentbox/event_stream.hpp>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agentbox;

TEST(EventStreamTest, EmitWithoutSubscribersIsNoop) {
    EventStream<int> stream;
    EXPECT_EQ(stream.SubscriberCount(), 0u);
    stream.Emit(1);
}

TEST(EventStreamTest, EveryObserverSeesEveryValueInOrder) {
    EventStream<int> stream;
    std::vector<int> first;
    std::vector<int> second;

    auto a = stream.Subscribe([&](const int& v) { first.push_back(v); });
    auto b = stream.Subscribe([&](const int& v) { second.push_back(v); });
    EXPECT_NE(a, b);

    stream.Emit(1);
    stream.Emit(2);
    stream.Emit(3);

    EXPECT_EQ(first, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(second, (std::vector<int>{1, 2, 3}));
}

TEST(EventStreamTest, NoReplayForLateSubscribers) {
    EventStream<std::string> stream;
    stream.Emit("early");

    std::vector<std::string> seen;
    auto id = stream.Subscribe([&](const std::string& v) { seen.push_back(v); });
    (void)id;

    stream.Emit("late");
    EXPECT_EQ(seen, (std::vector<std::string>{"late"}));
}

TEST(EventStreamTest, UnsubscribeStopsDelivery) {
    EventStream<int> stream;
    int calls = 0;

    auto id = stream.Subscribe([&](const int&) { ++calls; });
    stream.Emit(1);
    EXPECT_TRUE(stream.Unsubscribe(id));
    stream.Emit(2);

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(stream.Unsubscribe(id));
    EXPECT_EQ(stream.SubscriberCount(), 0u);
}

TEST(EventStreamTest, ScopedSubscriptionUnsubscribesOnDestruction) {
    EventStream<int> stream;
    int calls = 0;

    {
        auto guard = stream.SubscribeScoped([&](const int&) { ++calls; });
        EXPECT_EQ(stream.SubscriberCount(), 1u);
        stream.Emit(1);
    }

    stream.Emit(2);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(stream.SubscriberCount(), 0u);
}

TEST(EventStreamTest, ScopedSubscriptionMove) {
    EventStream<int> stream;
    int calls = 0;

    Subscription<int> outer;
    {
        auto inner = stream.SubscribeScoped([&](const int&) { ++calls; });
        outer = std::move(inner);
    }

    stream.Emit(1);
    EXPECT_EQ(calls, 1);

    outer.Reset();
    stream.Emit(2);
    EXPECT_EQ(calls, 1);
}

TEST(EventStreamTest, ReleasedSubscriptionStaysActive) {
    EventStream<int> stream;
    int calls = 0;

    SubscriptionId id{0};
    {
        auto guard = stream.SubscribeScoped([&](const int&) { ++calls; });
        id = guard.Release();
    }

    stream.Emit(1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(stream.Unsubscribe(id));
}

TEST(EventStreamTest, SubscriptionMayOutliveStream) {
    Subscription<int> guard;
    {
        EventStream<int> stream;
        guard = stream.SubscribeScoped([](const int&) {});
    }
    guard.Reset();
}

TEST(EventStreamTest, ObserverMayUnsubscribeItself) {
    EventStream<int> stream;
    int calls = 0;
    SubscriptionId id{0};

    id = stream.Subscribe([&](const int&) {
        ++calls;
        stream.Unsubscribe(id);
    });

    stream.Emit(1);
    stream.Emit(2);
    EXPECT_EQ(calls, 1);
}

TEST(EventStreamTest, ObserverExceptionsPropagate) {
    EventStream<int> stream;
    auto id = stream.Subscribe([](const int&) { throw std::runtime_error("observer"); });
    (void)id;

    EXPECT_THROW(stream.Emit(1), std::runtime_error);
}

TEST(EventStreamTest, CarriesExceptionPointers) {
    EventStream<std::exception_ptr> stream;
    std::string message;

    auto id = stream.Subscribe([&](const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            message = e.what();
        }
    });
    (void)id;

    stream.Emit(std::make_exception_ptr(std::logic_error("boom")));
    EXPECT_EQ(message, "boom");
}

TEST(EventStreamTest, ConcurrentEmitters) {
    EventStream<int> stream;
    std::atomic<int> total{0};
    auto id = stream.Subscribe([&](const int& v) { total.fetch_add(v); });
    (void)id;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                stream.Emit(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total.load(), 4000);
}
