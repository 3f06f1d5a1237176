#include <gtest/gtest.h>
#include "common/event_channel.hpp"
#include <chrono>
#include <thread>

TEST(EventChannelTest, FifoOrder) {
    EventChannel channel;
    channel.publish(PipelineEvent::stepChanged(PipelineStep::Mounting));
    channel.publish(PipelineEvent::progressed(40));
    channel.publish(PipelineEvent::finished(StatusCode::Complete, ""));
    EXPECT_EQ(channel.size(), 3u);

    auto first = channel.tryPop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, PipelineEvent::Type::StepChanged);
    EXPECT_EQ(first->step, PipelineStep::Mounting);
    EXPECT_EQ(first->text, "MOUNTING");

    auto second = channel.tryPop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->progress, 40);

    auto third = channel.tryPop();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->status, StatusCode::Complete);
    EXPECT_FALSE(channel.tryPop().has_value());
}

TEST(EventChannelTest, WaitPopAcrossThreads) {
    EventChannel channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.publish(PipelineEvent::log("hello"));
    });

    auto event = channel.waitPop(std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->text, "hello");
}

TEST(EventChannelTest, WaitPopTimesOut) {
    EventChannel channel;
    EXPECT_FALSE(channel.waitPop(std::chrono::milliseconds(10)).has_value());
}

TEST(EventChannelTest, ClosedChannelDropsEvents) {
    EventChannel channel;
    channel.close();
    EXPECT_TRUE(channel.isClosed());
    channel.publish(PipelineEvent::log("late"));
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_FALSE(channel.waitPop(std::chrono::seconds(1)).has_value());
}

TEST(EventChannelTest, UndrainedChannelKeepsNewestEvents) {
    EventChannel channel(3);
    for (int i = 1; i <= 5; ++i) {
        channel.publish(PipelineEvent::progressed(i * 10));
    }
    channel.publish(PipelineEvent::finished(StatusCode::Complete, ""));

    EXPECT_EQ(channel.size(), 3u);
    EXPECT_EQ(channel.droppedCount(), 3u);

    auto oldest = channel.tryPop();
    ASSERT_TRUE(oldest.has_value());
    EXPECT_EQ(oldest->progress, 40);
    channel.tryPop();
    auto last = channel.tryPop();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->type, PipelineEvent::Type::Finished);
}
