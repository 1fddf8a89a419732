#include <gtest/gtest.h>
#include "upq/events/event_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace upq::events;

TEST(ThreadSafeQueue, FifoOrder) {
    ThreadSafeQueue<int> queue;
    queue.push(42);
    queue.push(100);

    auto first = queue.pop();
    auto second = queue.pop();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, 42);
    EXPECT_EQ(*second, 100);
}

TEST(ThreadSafeQueue, TryPopOnEmpty) {
    ThreadSafeQueue<int> queue;
    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(123);
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 123);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    const auto start = std::chrono::steady_clock::now();
    auto value = queue.pop_for(std::chrono::milliseconds(50));
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(waited).count(), 45);
}

TEST(ThreadSafeQueue, ShutdownWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<bool> returned{false};

    std::thread consumer([&]() {
        auto value = queue.pop();
        EXPECT_FALSE(value.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_TRUE(returned);
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueue, ItemsQueuedBeforeShutdownStillDrain) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.shutdown();
    queue.push(8);  // ignored

    auto value = queue.pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto value = queue.pop()) {
            sum += *value;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
