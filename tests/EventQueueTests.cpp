#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "key_adhesion/event_queue.hpp"

using namespace kb::adh;

TEST(BoundedEventQueue, DrainPreservesEnqueueOrder)
{
    BoundedEventQueue queue(8);
    EXPECT_TRUE(queue.tryPush(KeyEvent::press("a", 0.0)));
    EXPECT_TRUE(queue.tryPush(KeyEvent::press("b", 0.1)));
    EXPECT_TRUE(queue.tryPush(KeyEvent::release("a", 0.2)));

    std::vector<KeyEvent> out;
    EXPECT_EQ(queue.drainInto(out), 3u);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].key(), "a");
    EXPECT_EQ(out[1].key(), "b");
    EXPECT_TRUE(out[2].isRelease());
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BoundedEventQueue, FullQueueDropsNewest)
{
    BoundedEventQueue queue(2);
    EXPECT_TRUE(queue.tryPush(KeyEvent::press("a", 0.0)));
    EXPECT_TRUE(queue.tryPush(KeyEvent::press("b", 0.1)));
    EXPECT_FALSE(queue.tryPush(KeyEvent::press("c", 0.2)));
    EXPECT_EQ(queue.droppedCount(), 1u);

    std::vector<KeyEvent> out;
    queue.drainInto(out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].key(), "b");
}

TEST(BoundedEventQueue, ZeroCapacityIsClampedToOne)
{
    BoundedEventQueue queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_TRUE(queue.tryPush(KeyEvent::press("a", 0.0)));
}

TEST(BoundedEventQueue, DefaultCapacity)
{
    BoundedEventQueue queue;
    EXPECT_EQ(queue.capacity(), 1000u);
}

TEST(BoundedEventQueue, ConcurrentProducersAccountForEveryEvent)
{
    BoundedEventQueue queue(100);
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&queue, t]() {
            for (int i = 0; i < 50; ++i) {
                queue.tryPush(KeyEvent::press("k" + std::to_string(t), i * 0.01));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    std::vector<KeyEvent> out;
    queue.drainInto(out);
    EXPECT_EQ(out.size(), 100u);
    EXPECT_EQ(queue.droppedCount(), 100u);
}
