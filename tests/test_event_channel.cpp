#include "appcast/update/event_channel.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

TEST(EventChannelTest, DeliversToEverySubscriberInOrder) {
    appcast::EventChannel<std::string> channel;
    std::vector<std::string> seen;
    channel.Subscribe([&](const std::string& s) { seen.push_back("a:" + s); });
    channel.Subscribe([&](const std::string& s) { seen.push_back("b:" + s); });

    channel.Publish("x");
    EXPECT_EQ(seen, (std::vector<std::string>{"a:x", "b:x"}));
}

TEST(EventChannelTest, UnsubscribeStopsDelivery) {
    appcast::EventChannel<int> channel;
    int calls = 0;
    const auto id = channel.Subscribe([&](const int&) { ++calls; });
    EXPECT_EQ(channel.SubscriberCount(), 1u);

    channel.Publish(1);
    EXPECT_TRUE(channel.Unsubscribe(id));
    EXPECT_FALSE(channel.Unsubscribe(id));
    channel.Publish(2);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(channel.SubscriberCount(), 0u);
}

TEST(EventChannelTest, ThrowingSubscriberDoesNotStopOthers) {
    appcast::EventChannel<int> channel;
    int delivered = 0;
    channel.Subscribe([](const int&) { throw std::runtime_error("boom"); });
    channel.Subscribe([&](const int& v) { delivered = v; });

    EXPECT_NO_THROW(channel.Publish(7));
    EXPECT_EQ(delivered, 7);
}

TEST(EventChannelTest, NonStandardThrowDoesNotStopOthers) {
    appcast::EventChannel<int> channel;
    int delivered = 0;
    channel.Subscribe([&](const int& v) { delivered += v; });
    channel.Subscribe([](const int&) { throw 42; });
    channel.Subscribe([&](const int& v) { delivered += v; });

    EXPECT_NO_THROW(channel.Publish(5));
    EXPECT_EQ(delivered, 10);
}

TEST(EventChannelTest, PublishWithoutSubscribersIsANoOp) {
    appcast::EventChannel<std::string> channel;
    EXPECT_NO_THROW(channel.Publish("nobody"));
}

} // namespace
