#include <gtest/gtest.h>
#include "utils/message_queue.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace fix_order_entry::utils;
using namespace std::chrono_literals;

TEST(MessageQueueTest, PreservesFifoOrder)
{
    MessageQueue<int> queue(16, "fifo");
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(queue.push(i));
    }

    int value = -1;
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(queue.tryPop(value));
        EXPECT_EQ(i, value);
    }
    EXPECT_FALSE(queue.tryPop(value));
    EXPECT_TRUE(queue.empty());
}

TEST(MessageQueueTest, RejectsWhenFull)
{
    MessageQueue<int> queue(2, "small");
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_FALSE(queue.push(3));

    EXPECT_EQ(2U, queue.size());
    EXPECT_EQ(2U, queue.capacity());
    EXPECT_EQ(1U, queue.getTotalRejected());
    EXPECT_EQ("small", queue.name());
}

TEST(MessageQueueTest, TimedPopExpires)
{
    MessageQueue<int> queue;
    int value = 0;

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(value, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(MessageQueueTest, ShutdownDrainsThenStops)
{
    MessageQueue<std::string> queue;
    queue.push("a");
    queue.push("b");
    queue.shutdown();

    EXPECT_TRUE(queue.isShutdown());
    EXPECT_FALSE(queue.push("c"));

    std::string value;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ("a", value);
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ("b", value);
    EXPECT_FALSE(queue.pop(value)); // no blocking once drained
}

TEST(MessageQueueTest, ShutdownWakesBlockedConsumer)
{
    MessageQueue<int> queue;
    std::atomic<bool> returned{false};

    std::thread consumer([&]()
                         {
        int value = 0;
        EXPECT_FALSE(queue.pop(value));
        returned = true; });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(returned.load());
    queue.shutdown();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

TEST(MessageQueueTest, MoveOnlyItems)
{
    MessageQueue<std::unique_ptr<int>> queue;
    ASSERT_TRUE(queue.push(std::make_unique<int>(42)));

    std::unique_ptr<int> item;
    ASSERT_TRUE(queue.tryPop(item));
    ASSERT_NE(nullptr, item);
    EXPECT_EQ(42, *item);
}

TEST(MessageQueueTest, ProducersAndConsumerExchangeEverything)
{
    MessageQueue<int> queue(10000, "mpsc");
    const int producers = 4;
    const int per_producer = 1000;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p)
    {
        threads.emplace_back([&queue, p]()
                             {
            for (int i = 0; i < per_producer; ++i)
            {
                while (!queue.push(p * per_producer + i))
                {
                    std::this_thread::yield();
                }
            } });
    }

    long long sum = 0;
    int received = 0;
    int value = 0;
    while (received < producers * per_producer && queue.pop(value, 2s))
    {
        sum += value;
        ++received;
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    const long long n = producers * per_producer;
    EXPECT_EQ(n, received);
    EXPECT_EQ(n * (n - 1) / 2, sum);
    EXPECT_EQ(static_cast<uint64_t>(n), queue.getTotalPopped());
}
