/**
 * @file test_impact_queue.cpp
 * @brief Bounded session event queue between the session manager and the control service.
 */

#include <gtest/gtest.h>
#include <thread>
#include "communication/impact_queue.hpp"

namespace
{
    SessionEvent impactEvent(int sequence)
    {
        SessionEvent event;
        event.type = "impact";
        event.session_id = "20261019-101500-000";
        event.impact.sequence = sequence;
        return event;
    }
}

TEST(ImpactQueueTest, DeliversInOrder)
{
    ImpactQueue queue;
    queue.push(impactEvent(1));
    queue.push(impactEvent(2));

    SessionEvent event;
    ASSERT_TRUE(queue.pop(event, 0));
    EXPECT_EQ(event.impact.sequence, 1);
    ASSERT_TRUE(queue.pop(event, 0));
    EXPECT_EQ(event.impact.sequence, 2);
    EXPECT_FALSE(queue.pop(event, 0));
}

TEST(ImpactQueueTest, FullQueueDropsOldest)
{
    ImpactQueue queue(3);

    EXPECT_TRUE(queue.push(impactEvent(1)));
    EXPECT_TRUE(queue.push(impactEvent(2)));
    EXPECT_TRUE(queue.push(impactEvent(3)));
    EXPECT_FALSE(queue.push(impactEvent(4)));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 1u);

    SessionEvent event;
    ASSERT_TRUE(queue.pop(event, 0));
    EXPECT_EQ(event.impact.sequence, 2);
}

// Nobody listening: memory stays bounded however long the session runs
TEST(ImpactQueueTest, UnreadQueueStaysBounded)
{
    ImpactQueue queue(16);

    for (int i = 1; i <= 1000; i++)
        queue.push(impactEvent(i));

    EXPECT_EQ(queue.size(), 16u);
    EXPECT_EQ(queue.dropped(), 984u);

    SessionEvent event;
    ASSERT_TRUE(queue.pop(event, 0));
    EXPECT_EQ(event.impact.sequence, 985);
}

TEST(ImpactQueueTest, ZeroCapacityHoldsOne)
{
    ImpactQueue queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}

TEST(ImpactQueueTest, PopWaitsForProducer)
{
    ImpactQueue queue;

    std::thread producer([&]()
                         {
                             std::this_thread::sleep_for(std::chrono::milliseconds(20));
                             queue.push(impactEvent(7));
                         });

    SessionEvent event;
    EXPECT_TRUE(queue.pop(event, 5000));
    EXPECT_EQ(event.impact.sequence, 7);
    producer.join();
}
