#include <gtest/gtest.h>
#include "common/event/event_loop.h"
#include "common/event/timer.h"
#include "common/net/datagram_socket.h"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Handles must outlive the loop's Stop(), so every test stops the loop
// explicitly before its timers and sockets go out of scope.
class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    template<typename Pred>
    bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }
};

TEST_F(EventLoopTest, StartStop) {
    RDSH::EventLoop loop;
    ASSERT_TRUE(loop.Valid());
    EXPECT_FALSE(loop.Running());

    ASSERT_TRUE(loop.Start());
    EXPECT_TRUE(loop.Running());
    EXPECT_FALSE(loop.Start());

    loop.Stop();
    EXPECT_FALSE(loop.Running());
}

TEST_F(EventLoopTest, Post_RunsOnLoopThread) {
    RDSH::EventLoop loop;
    ASSERT_TRUE(loop.Start());
    EXPECT_FALSE(loop.IsLoopThread());

    std::promise<bool> on_loop;
    auto result = on_loop.get_future();
    ASSERT_TRUE(loop.Post([&]() { on_loop.set_value(loop.IsLoopThread()); }));

    ASSERT_EQ(result.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(result.get());
    loop.Stop();
}

TEST_F(EventLoopTest, Post_RejectedWhenNotRunning) {
    RDSH::EventLoop loop;
    EXPECT_FALSE(loop.Post([]() {}));

    ASSERT_TRUE(loop.Start());
    loop.Stop();
    EXPECT_FALSE(loop.Post([]() {}));
}

TEST_F(EventLoopTest, Post_PreservesOrder) {
    RDSH::EventLoop loop;
    ASSERT_TRUE(loop.Start());

    std::vector<int> order;
    std::promise<void> done;
    for (int i = 0; i < 100; i++) {
        loop.Post([&order, i]() { order.push_back(i); });
    }
    loop.Post([&done]() { done.set_value(); });

    ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    loop.Stop();

    ASSERT_EQ(order.size(), 100u);
    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(order[i], i);
    }
}

TEST_F(EventLoopTest, Post_ThrowingTaskDoesNotStopLoop) {
    RDSH::EventLoop loop;
    ASSERT_TRUE(loop.Start());

    std::promise<void> after;
    loop.Post([]() { throw std::runtime_error("task failure"); });
    loop.Post([&after]() { after.set_value(); });

    EXPECT_EQ(after.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(loop.Running());
    loop.Stop();
}

TEST_F(EventLoopTest, Timer_Repeats) {
    RDSH::EventLoop loop;
    std::atomic<int> count(0);
    RDSH::Timer timer(loop, [&count](RDSH::Timer *) { count++; });
    timer.Start(10);

    ASSERT_TRUE(loop.Start());
    EXPECT_TRUE(WaitFor([&count]() { return count >= 3; }));
    loop.Stop();
}

TEST_F(EventLoopTest, Timer_OneShot) {
    RDSH::EventLoop loop;
    std::atomic<int> count(0);
    RDSH::Timer timer(loop, [&count](RDSH::Timer *) { count++; });
    timer.Start(10, false);

    ASSERT_TRUE(loop.Start());
    EXPECT_TRUE(WaitFor([&count]() { return count >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    loop.Stop();

    EXPECT_EQ(count.load(), 1);
}

TEST_F(EventLoopTest, Timer_StopFromCallback) {
    RDSH::EventLoop loop;
    std::atomic<int> count(0);
    RDSH::Timer timer(loop, [&count](RDSH::Timer *t) {
        count++;
        t->Stop();
    });
    timer.Start(5);

    ASSERT_TRUE(loop.Start());
    EXPECT_TRUE(WaitFor([&count]() { return count >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    loop.Stop();

    EXPECT_EQ(count.load(), 1);
}

TEST_F(EventLoopTest, ResolveIPv4) {
    RDSH::EventLoop loop;
    std::string out;
    ASSERT_TRUE(RDSH::Net::ResolveIPv4(loop.Handle(), "127.0.0.1", out));
    EXPECT_EQ(out, "127.0.0.1");

    ASSERT_TRUE(RDSH::Net::ResolveIPv4(loop.Handle(), "localhost", out));
    EXPECT_EQ(out.substr(0, 4), "127.");
}

TEST_F(EventLoopTest, DatagramSocket_Exchange) {
    RDSH::EventLoop loop;
    RDSH::Net::DatagramSocket a(loop);
    RDSH::Net::DatagramSocket b(loop);
    ASSERT_TRUE(a.Bind("127.0.0.1", 0));
    ASSERT_TRUE(b.Bind("127.0.0.1", 0));
    EXPECT_NE(a.LocalPort(), 0);
    EXPECT_NE(a.LocalPort(), b.LocalPort());

    std::promise<std::string> received;
    std::atomic<int> from_port(0);
    b.OnReceive([&](const std::string &endpoint, int port, const char *data, size_t size) {
        EXPECT_EQ(endpoint, "127.0.0.1");
        from_port = port;
        received.set_value(std::string(data, size));
    });

    ASSERT_TRUE(loop.Start());
    ASSERT_TRUE(a.SendTo("127.0.0.1", b.LocalPort(), "datagram"));

    auto result = received.get_future();
    ASSERT_EQ(result.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(result.get(), "datagram");
    EXPECT_EQ(from_port.load(), a.LocalPort());

    EXPECT_TRUE(WaitFor([&a]() { return a.GetStats().sent_packets == 1; }));
    loop.Stop();

    EXPECT_EQ(a.GetStats().sent_bytes, 8u);
    EXPECT_EQ(b.GetStats().recv_packets, 1u);
    EXPECT_EQ(b.GetStats().recv_bytes, 8u);
}

TEST_F(EventLoopTest, DatagramSocket_SimulatedLossDropsEverything) {
    RDSH::EventLoop loop;
    RDSH::Net::DatagramSocket a(loop);
    RDSH::Net::DatagramSocket b(loop);
    ASSERT_TRUE(a.Bind("127.0.0.1", 0));
    ASSERT_TRUE(b.Bind("127.0.0.1", 0));
    b.SetSimulatedInPacketLoss(100);

    std::atomic<int> delivered(0);
    b.OnReceive([&delivered](const std::string &, int, const char *, size_t) { delivered++; });

    ASSERT_TRUE(loop.Start());
    for (int i = 0; i < 10; i++) {
        a.SendTo("127.0.0.1", b.LocalPort(), "lost");
    }

    EXPECT_TRUE(WaitFor([&b]() { return b.GetStats().dropped_packets == 10; }));
    loop.Stop();

    EXPECT_EQ(delivered.load(), 0);
    EXPECT_EQ(b.GetStats().recv_packets, 0u);
}

TEST_F(EventLoopTest, DatagramSocket_BindConflictFails) {
    RDSH::EventLoop loop;
    RDSH::Net::DatagramSocket a(loop);
    RDSH::Net::DatagramSocket b(loop);
    ASSERT_TRUE(a.Bind("127.0.0.1", 0));
    EXPECT_FALSE(b.Bind("127.0.0.1", a.LocalPort()));
    EXPECT_FALSE(a.Bind("127.0.0.1", 0));
    loop.Stop();
}

TEST_F(EventLoopTest, DatagramSocket_SendRejectedAfterStop) {
    RDSH::EventLoop loop;
    RDSH::Net::DatagramSocket a(loop);
    ASSERT_TRUE(a.Bind("127.0.0.1", 0));
    ASSERT_TRUE(loop.Start());
    loop.Stop();

    EXPECT_FALSE(a.SendTo("127.0.0.1", 9, "late"));
}
