#include <gtest/gtest.h>
#include <agentbox/reply_channel.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace agentbox;
using namespace std::chrono_literals;

TEST(ReplyChannelTest, DefaultChannelIsInvalid) {
    ReplyChannel<int> channel;
    EXPECT_FALSE(channel.IsValid());
    EXPECT_FALSE(static_cast<bool>(channel));
    EXPECT_FALSE(channel.Reply(1));
}

TEST(ReplyChannelTest, ResolverReceivesValue) {
    int seen = 0;
    ReplyChannel<int> channel([&](int value) {
        seen = value;
        return true;
    });

    EXPECT_TRUE(channel.IsValid());
    EXPECT_TRUE(channel.Reply(42));
    EXPECT_EQ(seen, 42);
}

TEST(ReplyChannelTest, FirstReplyWins) {
    auto slot = std::make_shared<detail::ReplySlot<std::string>>();
    auto channel = detail::MakeReplyChannel(slot);
    auto copy = channel;

    EXPECT_TRUE(channel.Reply("first"));
    EXPECT_FALSE(copy.Reply("second"));
    EXPECT_FALSE(channel.Reply("third"));

    auto [result, value] = slot->Wait(std::nullopt);
    ASSERT_EQ(result, ReplyResult::Success);
    EXPECT_EQ(*value, "first");
}

TEST(ReplyChannelTest, CancelBeforeReply) {
    auto slot = std::make_shared<detail::ReplySlot<int>>();
    auto channel = detail::MakeReplyChannel(slot);

    EXPECT_TRUE(slot->TryCancel());
    EXPECT_FALSE(channel.Reply(1));
    EXPECT_EQ(slot->GetState(), detail::ReplySlot<int>::State::Cancelled);

    auto [result, value] = slot->Wait(std::nullopt);
    EXPECT_EQ(result, ReplyResult::Cancelled);
    EXPECT_FALSE(value.has_value());
}

TEST(ReplyChannelTest, ReplyBeforeCancel) {
    auto slot = std::make_shared<detail::ReplySlot<int>>();
    auto channel = detail::MakeReplyChannel(slot);

    EXPECT_TRUE(channel.Reply(5));
    EXPECT_FALSE(slot->TryCancel());
    EXPECT_FALSE(slot->TryTimeout());

    auto [result, value] = slot->Wait(std::nullopt);
    EXPECT_EQ(result, ReplyResult::Success);
    EXPECT_EQ(*value, 5);
}

TEST(ReplyChannelTest, WaitTimesOut) {
    auto slot = std::make_shared<detail::ReplySlot<int>>();
    auto channel = detail::MakeReplyChannel(slot);

    auto start = std::chrono::steady_clock::now();
    auto [result, value] = slot->Wait(start + 30ms);

    EXPECT_EQ(result, ReplyResult::TimedOut);
    EXPECT_FALSE(value.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);

    // Late reply is rejected
    EXPECT_FALSE(channel.Reply(1));
}

TEST(ReplyChannelTest, ReplyFromAnotherThreadWakesWaiter) {
    auto slot = std::make_shared<detail::ReplySlot<int>>();
    auto channel = detail::MakeReplyChannel(slot);

    std::thread replier([channel]() {
        std::this_thread::sleep_for(20ms);
        EXPECT_TRUE(channel.Reply(99));
    });

    auto [result, value] = slot->Wait(std::chrono::steady_clock::now() + 5s);
    replier.join();

    ASSERT_EQ(result, ReplyResult::Success);
    EXPECT_EQ(*value, 99);
}

TEST(ReplyChannelTest, ChannelKeepsSlotAlive) {
    ReplyChannel<int> channel;
    {
        auto slot = std::make_shared<detail::ReplySlot<int>>();
        channel = detail::MakeReplyChannel(slot);
    }
    // Poster gone; replying is still safe
    EXPECT_TRUE(channel.Reply(3));
}
