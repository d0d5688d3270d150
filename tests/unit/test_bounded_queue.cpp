#include <gtest/gtest.h>
#include "utils/bounded_queue.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace livetranslate::utils;

TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    EXPECT_EQ(*queue.pop(), 1);
    EXPECT_EQ(*queue.pop(), 2);
    EXPECT_EQ(*queue.pop(), 3);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BoundedQueueTest, ZeroCapacityBecomesOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}

TEST(BoundedQueueTest, PushBlocksWhenFull) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed);

    EXPECT_EQ(*queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(*queue.pop(), 2);
}

TEST(BoundedQueueTest, CloseUnblocksProducer) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> result{true};
    std::thread producer([&]() { result = queue.push(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    producer.join();

    EXPECT_FALSE(result);
    EXPECT_TRUE(queue.isClosed());
}

TEST(BoundedQueueTest, PopDrainsAfterClose) {
    BoundedQueue<std::string> queue(4);
    queue.push("a");
    queue.push("b");
    queue.close();

    EXPECT_FALSE(queue.push("c"));
    EXPECT_EQ(*queue.pop(), "a");
    EXPECT_EQ(*queue.pop(), "b");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, PopUntilTimesOut) {
    BoundedQueue<int> queue(2);
    int out = -1;

    auto start = std::chrono::steady_clock::now();
    auto status = queue.popUntil(start + std::chrono::milliseconds(30), out);

    EXPECT_EQ(status, BoundedQueue<int>::PopStatus::TIMEOUT);
    EXPECT_EQ(out, -1);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(30));
}

TEST(BoundedQueueTest, PopUntilReturnsItemAndClosed) {
    BoundedQueue<int> queue(2);
    queue.push(7);
    queue.close();
    int out = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);

    EXPECT_EQ(queue.popUntil(deadline, out), BoundedQueue<int>::PopStatus::ITEM);
    EXPECT_EQ(out, 7);
    EXPECT_EQ(queue.popUntil(deadline, out), BoundedQueue<int>::PopStatus::CLOSED);
}
