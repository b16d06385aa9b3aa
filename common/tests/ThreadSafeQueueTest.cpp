#include <gtest/gtest.h>
#include <ThreadSafeQueue.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ThreadSafeQueueTest : public ::testing::Test {
protected:
    ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, PopReturnsItemsInArrivalOrder) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.push(i));
    }

    for (int i = 0; i < 5; ++i) {
        auto item = queue.pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, i);
    }
    EXPECT_TRUE(queue.isEmpty());
}

TEST_F(ThreadSafeQueueTest, PushAfterShutdown_IsRejected) {
    queue.shutdown();

    EXPECT_FALSE(queue.push(1));
    EXPECT_TRUE(queue.isShutdown());
    EXPECT_EQ(queue.size(), 0u);
}

TEST_F(ThreadSafeQueueTest, Shutdown_DrainsRemainingThenReturnsNullopt) {
    queue.push(7);
    queue.shutdown();

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(ThreadSafeQueueTest, Shutdown_WakesBlockedConsumer) {
    std::thread consumer([this]() {
        auto item = queue.pop();
        EXPECT_FALSE(item.has_value());
    });

    std::this_thread::sleep_for(20ms);
    queue.shutdown();
    consumer.join();
}

TEST_F(ThreadSafeQueueTest, Clear_DropsPendingItems) {
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.clear(), 3u);
    EXPECT_TRUE(queue.isEmpty());
}

TEST_F(ThreadSafeQueueTest, SingleConsumer_SeesProducerOrder) {
    const int COUNT = 1000;
    std::vector<int> received;

    std::thread consumer([this, &received]() {
        while (auto item = queue.pop()) {
            received.push_back(*item);
        }
    });

    for (int i = 0; i < COUNT; ++i) {
        queue.push(i);
    }
    queue.shutdown();
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(COUNT));
    for (int i = 0; i < COUNT; ++i) {
        EXPECT_EQ(received[i], i);
    }
}
