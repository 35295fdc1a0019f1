#include <gtest/gtest.h>
#include "shareup/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace shareup::events;

TEST(ThreadSafeQueue, FifoOrder) {
    ThreadSafeQueue<int> queue;
    queue.push(42);
    queue.push(100);

    EXPECT_EQ(queue.pop().value(), 42);
    EXPECT_EQ(queue.pop().value(), 100);
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueue, TryPopOnEmpty) {
    ThreadSafeQueue<int> queue;
    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(7);
    EXPECT_EQ(queue.try_pop().value_or(-1), 7);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(elapsed.count(), 90);
}

TEST(ThreadSafeQueue, CloseDrainsThenEnds) {
    ThreadSafeQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_FALSE(queue.push(3));
    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, CloseWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<bool> woke{false};

    std::thread consumer([&]() {
        auto val = queue.pop();
        woke = !val.has_value();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();

    EXPECT_TRUE(woke.load());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += *val;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
