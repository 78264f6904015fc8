#include "core/downloader/BoundedQueue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using trackdl::core::downloader::BoundedQueue;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, RejectsZeroCapacity) {
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(BoundedQueueTest, PopsInPushOrder) {
    BoundedQueue<std::string> queue(4);
    EXPECT_TRUE(queue.push("a"));
    EXPECT_TRUE(queue.push("b"));
    EXPECT_TRUE(queue.push("c"));
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(queue.pop(), "a");
    EXPECT_EQ(queue.pop(), "b");
    EXPECT_EQ(queue.pop(), "c");
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BoundedQueueTest, AcceptsMoveOnlyItems) {
    BoundedQueue<std::unique_ptr<int>> queue(1);
    ASSERT_TRUE(queue.push(std::make_unique<int>(7)));

    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(**item, 7);
}

TEST(BoundedQueueTest, PushBlocksWhileFull) {
    BoundedQueue<int> queue(2);
    queue.push(1);
    queue.push(2);

    auto producer = std::async(std::launch::async, [&queue] { return queue.push(3); });
    EXPECT_EQ(producer.wait_for(100ms), std::future_status::timeout);
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop(), 1);
    ASSERT_EQ(producer.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(producer.get());

    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(BoundedQueueTest, PopBlocksWhileEmpty) {
    BoundedQueue<int> queue(2);

    auto consumer = std::async(std::launch::async, [&queue] { return queue.pop(); });
    EXPECT_EQ(consumer.wait_for(100ms), std::future_status::timeout);

    queue.push(42);
    ASSERT_EQ(consumer.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(consumer.get(), 42);
}

TEST(BoundedQueueTest, CloseReleasesBlockedCallers) {
    BoundedQueue<int> full(1);
    full.push(1);
    auto producer = std::async(std::launch::async, [&full] { return full.push(2); });

    BoundedQueue<int> empty(1);
    auto consumer = std::async(std::launch::async, [&empty] { return empty.pop(); });

    std::this_thread::sleep_for(50ms);
    full.close();
    empty.close();

    ASSERT_EQ(producer.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(producer.get());
    ASSERT_EQ(consumer.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(consumer.get().has_value());
}

TEST(BoundedQueueTest, ClosedQueueRefusesWorkButKeepsItemsUntilCleared) {
    BoundedQueue<int> queue(3);
    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_FALSE(queue.push(3));
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.clear(), 2u);
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(queue.clear(), 0u);
}

TEST(BoundedQueueTest, ReopenDiscardsLeftoversAndAcceptsPushes) {
    BoundedQueue<int> queue(2);
    queue.push(1);
    queue.close();

    queue.reopen();
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.push(5));
    EXPECT_EQ(queue.pop(), 5);
}

TEST(BoundedQueueTest, ManyProducersAndConsumersDeliverEachItemOnce) {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;
    BoundedQueue<int> queue(8);

    std::mutex seenMutex;
    std::multiset<int> seen;

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&] {
            while (auto item = queue.pop()) {
                std::lock_guard<std::mutex> lock(seenMutex);
                seen.insert(*item);
                if (seen.size() == static_cast<size_t>(kProducers * kPerProducer)) {
                    queue.close();
                }
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.push(p * kPerProducer + i);
            }
        });
    }

    for (auto& t : producers) {
        t.join();
    }
    for (auto& t : consumers) {
        t.join();
    }

    ASSERT_EQ(seen.size(), static_cast<size_t>(kProducers * kPerProducer));
    for (int value = 0; value < kProducers * kPerProducer; ++value) {
        EXPECT_EQ(seen.count(value), 1u) << "value " << value;
    }
}
