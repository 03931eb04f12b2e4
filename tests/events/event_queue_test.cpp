#include <gtest/gtest.h>
#include "hsync/events/event_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace hsync::events;
using namespace std::chrono_literals;

enum class Wake { Manual, Connectivity };

TEST(WakeQueue, FifoOrder) {
    WakeQueue<Wake> queue;

    queue.push(Wake::Connectivity);
    queue.push(Wake::Manual);

    auto first = queue.pop_for(0ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, Wake::Connectivity);

    auto second = queue.pop_for(0ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, Wake::Manual);

    EXPECT_FALSE(queue.pop_for(0ms).has_value());
}

TEST(WakeQueue, PushUniqueCoalescesWaitingItems) {
    WakeQueue<Wake> queue;

    EXPECT_TRUE(queue.push_unique(Wake::Manual));
    EXPECT_FALSE(queue.push_unique(Wake::Manual));
    EXPECT_TRUE(queue.push_unique(Wake::Connectivity));
    EXPECT_EQ(queue.size(), 2u);

    ASSERT_EQ(queue.pop_for(0ms), Wake::Manual);

    // Once taken, the same kind may queue again
    EXPECT_TRUE(queue.push_unique(Wake::Manual));
    EXPECT_EQ(queue.size(), 2u);
}

TEST(WakeQueue, PopForTimesOut) {
    WakeQueue<Wake> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(100ms);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(elapsed.count(), 90);
    EXPECT_FALSE(queue.is_shutdown());
}

TEST(WakeQueue, PopForWakesOnPush) {
    WakeQueue<Wake> queue;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.push(Wake::Manual);
    });

    auto val = queue.pop_for(5s);
    producer.join();

    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(*val, Wake::Manual);
}

TEST(WakeQueue, ShutdownReleasesWaitersAndDropsItems) {
    WakeQueue<Wake> queue;

    std::thread waiter([&queue]() {
        auto val = queue.pop_for(10s);
        EXPECT_FALSE(val.has_value());
    });

    std::this_thread::sleep_for(20ms);
    queue.shutdown();
    waiter.join();

    EXPECT_TRUE(queue.is_shutdown());
    queue.push(Wake::Manual);
    EXPECT_FALSE(queue.push_unique(Wake::Connectivity));
    EXPECT_EQ(queue.size(), 0u);

    queue.reset();
    queue.push(Wake::Manual);
    EXPECT_EQ(queue.pop_for(0ms), Wake::Manual);
}

TEST(WakeQueue, ProducerConsumer) {
    WakeQueue<int> queue;
    std::atomic<int> sum{0};
    std::atomic<int> received{0};

    std::thread consumer([&]() {
        while (received < 100) {
            if (auto val = queue.pop_for(1s)) {
                sum += *val;
                received++;
            } else {
                break;
            }
        }
    });

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(received, 100);
    EXPECT_EQ(sum, 4950);
}
