#include <gtest/gtest.h>
#include "common/util/channel.h"
#include <chrono>
#include <string>
#include <thread>

class ChannelTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ChannelTest, PushPop_Fifo) {
    RDSH::Channel<int> ch;
    EXPECT_TRUE(ch.Push(1));
    EXPECT_TRUE(ch.Push(2));
    EXPECT_TRUE(ch.Push(3));
    EXPECT_EQ(ch.Size(), 3u);

    EXPECT_EQ(ch.TryPop().value(), 1);
    EXPECT_EQ(ch.PopFor(std::chrono::milliseconds(10)).value(), 2);
    EXPECT_EQ(ch.TryPop().value(), 3);
    EXPECT_FALSE(ch.TryPop().has_value());
}

TEST_F(ChannelTest, PopFor_TimesOutWhenEmpty) {
    RDSH::Channel<int> ch;
    auto start = std::chrono::steady_clock::now();
    auto v = ch.PopFor(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(v.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(45));
}

TEST_F(ChannelTest, PopFor_WakesOnPushFromOtherThread) {
    RDSH::Channel<std::string> ch;
    std::thread producer([&ch]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.Push("ACK");
    });

    auto v = ch.PopFor(std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "ACK");
}

TEST_F(ChannelTest, Close_WakesWaitersAndRejectsPush) {
    RDSH::Channel<int> ch;
    ch.Push(1);

    std::thread closer([&ch]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.Close();
    });

    // First pop gets the queued item, second blocks until close.
    EXPECT_TRUE(ch.PopFor(std::chrono::seconds(5)).has_value());
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ch.PopFor(std::chrono::seconds(5)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
    closer.join();

    EXPECT_TRUE(ch.Closed());
    EXPECT_FALSE(ch.Push(2));
    EXPECT_EQ(ch.Size(), 0u);
}

TEST_F(ChannelTest, Clear_DropsItems) {
    RDSH::Channel<int> ch;
    ch.Push(1);
    ch.Push(2);
    ch.Clear();
    EXPECT_EQ(ch.Size(), 0u);
    EXPECT_FALSE(ch.Closed());
}
