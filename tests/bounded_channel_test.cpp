#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "csvsplit/bounded_channel.hpp"

namespace csvsplit {
namespace test {

TEST(BoundedChannelTest, FifoOrder) {
    BoundedChannel<int> channel(4);
    EXPECT_TRUE(channel.send(1));
    EXPECT_TRUE(channel.send(2));
    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(*channel.receive(), 1);
    EXPECT_EQ(*channel.receive(), 2);
}

TEST(BoundedChannelTest, CloseDrainsThenEnds) {
    BoundedChannel<std::string> channel(0);
    channel.send("a");
    channel.send("b");
    channel.close();

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.send("late"));
    EXPECT_EQ(*channel.receive(), "a");
    EXPECT_EQ(*channel.receive(), "b");
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(BoundedChannelTest, SendBlocksWhenFull) {
    BoundedChannel<int> channel(2);
    channel.send(0);
    channel.send(1);

    std::atomic<bool> sent{false};
    std::thread producer([&] {
        channel.send(2);
        sent = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(sent);
    EXPECT_EQ(channel.size(), 2u);

    EXPECT_EQ(*channel.receive(), 0);
    producer.join();
    EXPECT_TRUE(sent);
    EXPECT_EQ(channel.size(), 2u);
}

TEST(BoundedChannelTest, ProducerConsumerKeepsEverything) {
    BoundedChannel<int> channel(8);
    const int count = 10000;

    std::thread producer([&] {
        for (int i = 0; i < count; ++i) {
            channel.send(i);
        }
        channel.close();
    });

    std::vector<int> received;
    while (auto item = channel.receive()) {
        received.push_back(*item);
    }
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

TEST(BoundedChannelTest, CloseWakesBlockedReceiver) {
    BoundedChannel<int> channel(1);
    std::thread consumer([&] { EXPECT_FALSE(channel.receive().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    consumer.join();
}

}  // namespace test
}  // namespace csvsplit
