#include <gtest/gtest.h>
#include <ThreadSafeQueue.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

class ThreadSafeQueueTest : public ::testing::Test {
protected:
    ThreadSafeQueue<std::string> queue;
};

// Базовые тесты
TEST_F(ThreadSafeQueueTest, PushAndPop_Fifo) {
    queue.push("first");
    queue.push("second");

    auto a = queue.pop();
    auto b = queue.pop();

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, "first");
    EXPECT_EQ(*b, "second");
    EXPECT_TRUE(queue.isEmpty());
}

TEST_F(ThreadSafeQueueTest, TryPop_EmptyQueue) {
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST_F(ThreadSafeQueueTest, PushAfterShutdown_Rejected) {
    queue.shutdown();

    EXPECT_FALSE(queue.push("late"));
    EXPECT_EQ(queue.size(), 0u);
}

// После shutdown оставшиеся элементы всё ещё выдаются
TEST_F(ThreadSafeQueueTest, Shutdown_DrainsRemainingItems) {
    queue.push("a");
    queue.push("b");
    queue.shutdown();

    EXPECT_EQ(*queue.pop(), "a");
    EXPECT_EQ(*queue.pop(), "b");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(ThreadSafeQueueTest, Shutdown_WakesBlockedConsumer) {
    std::atomic<bool> returned(false);

    std::thread consumer([this, &returned]() {
        auto item = queue.pop();
        EXPECT_FALSE(item.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_TRUE(returned);
}

TEST_F(ThreadSafeQueueTest, Reopen_AcceptsAgain) {
    queue.shutdown();
    queue.reopen();

    EXPECT_TRUE(queue.push("again"));
    EXPECT_EQ(*queue.pop(), "again");
}

// Несколько производителей, один потребитель
TEST_F(ThreadSafeQueueTest, MultipleProducers_AllItemsDelivered) {
    const int NUM_PRODUCERS = 4;
    const int ITEMS_PER_PRODUCER = 250;

    std::vector<std::thread> producers;
    for (int p = 0; p < NUM_PRODUCERS; ++p) {
        producers.emplace_back([this, p]() {
            for (int i = 0; i < ITEMS_PER_PRODUCER; ++i) {
                queue.push("p" + std::to_string(p) + "_" + std::to_string(i));
            }
        });
    }

    int received = 0;
    std::thread consumer([this, &received]() {
        while (auto item = queue.pop()) {
            ++received;
        }
    });

    for (auto& t : producers) {
        t.join();
    }
    queue.shutdown();
    consumer.join();

    EXPECT_EQ(received, NUM_PRODUCERS * ITEMS_PER_PRODUCER);
}
