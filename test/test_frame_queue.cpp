/**
 * @file test_frame_queue.cpp
 * @brief Bounded drop-oldest hand-off between the acquisition and detection workers.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "communication/frame_queue.hpp"

namespace
{
    Frame numbered(uint64_t sequence)
    {
        Frame frame;
        frame.image = cv::Mat::zeros(4, 4, CV_8UC3);
        frame.sequence = sequence;
        return frame;
    }
}

TEST(FrameQueueTest, FullQueueDropsOldest)
{
    FrameQueue queue(2);

    EXPECT_TRUE(queue.push(numbered(1)));
    EXPECT_TRUE(queue.push(numbered(2)));
    EXPECT_FALSE(queue.push(numbered(3)));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 1u);

    Frame frame;
    ASSERT_TRUE(queue.pop(frame, 0));
    EXPECT_EQ(frame.sequence, 2u);
    ASSERT_TRUE(queue.pop(frame, 0));
    EXPECT_EQ(frame.sequence, 3u);
}

TEST(FrameQueueTest, PopTimesOutWhenEmpty)
{
    FrameQueue queue;
    Frame frame;

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(frame, 50));
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    EXPECT_GE(waited, 40);
}

TEST(FrameQueueTest, CloseWakesWaitingConsumer)
{
    FrameQueue queue;
    bool popped = true;

    std::thread consumer([&]()
                         {
                             Frame frame;
                             popped = queue.pop(frame, 10000);
                         });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto start = std::chrono::steady_clock::now();
    queue.close();
    consumer.join();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    EXPECT_FALSE(popped);
    EXPECT_LT(waited, 5000);
    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.push(numbered(1)));
}

TEST(FrameQueueTest, ClosedQueueDrainsRemainingFrames)
{
    FrameQueue queue(3);
    queue.push(numbered(7));
    queue.close();

    Frame frame;
    ASSERT_TRUE(queue.pop(frame, 0));
    EXPECT_EQ(frame.sequence, 7u);
    EXPECT_FALSE(queue.pop(frame, 0));
}

TEST(FrameQueueTest, ClearEmptiesQueue)
{
    FrameQueue queue;
    queue.push(numbered(1));
    queue.push(numbered(2));
    queue.clear();

    EXPECT_EQ(queue.size(), 0u);
    Frame frame;
    EXPECT_FALSE(queue.pop(frame, 0));
}

// Producer much faster than the consumer: memory stays bounded
TEST(FrameQueueTest, FastProducerStaysBounded)
{
    FrameQueue queue(2);
    for (uint64_t i = 1; i <= 100; i++)
    {
        queue.push(numbered(i));
        EXPECT_LE(queue.size(), 2u);
    }

    EXPECT_EQ(queue.dropped(), 98u);
    Frame frame;
    ASSERT_TRUE(queue.pop(frame, 0));
    EXPECT_EQ(frame.sequence, 99u);
}
