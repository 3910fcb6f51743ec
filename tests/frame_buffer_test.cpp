#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "vigil/frame_buffer.hpp"

using vigil::FrameBuffer;

TEST(FrameBufferTest, PopsInPushOrder) {
    FrameBuffer<int> buf(3);
    EXPECT_TRUE(buf.push(1));
    EXPECT_TRUE(buf.push(2));
    EXPECT_TRUE(buf.try_push(3));
    EXPECT_EQ(buf.size(), 3u);

    int out = 0;
    ASSERT_TRUE(buf.pop(out));
    EXPECT_EQ(out, 1);
    ASSERT_TRUE(buf.pop(out));
    EXPECT_EQ(out, 2);
    ASSERT_TRUE(buf.pop(out));
    EXPECT_EQ(out, 3);
}

TEST(FrameBufferTest, TryPushDropsWhenFull) {
    FrameBuffer<int> buf(2);
    EXPECT_TRUE(buf.try_push(1));
    EXPECT_TRUE(buf.try_push(2));
    EXPECT_FALSE(buf.try_push(3));
    EXPECT_EQ(buf.size(), buf.capacity());
}

TEST(FrameBufferTest, StopDrainsRemainingItems) {
    FrameBuffer<int> buf(4);
    buf.push(7);
    buf.stop();
    EXPECT_TRUE(buf.stopped());
    EXPECT_FALSE(buf.push(8));
    EXPECT_FALSE(buf.try_push(9));

    int out = 0;
    ASSERT_TRUE(buf.pop(out));
    EXPECT_EQ(out, 7);
    EXPECT_FALSE(buf.pop(out));
}

TEST(FrameBufferTest, StopWakesBlockedConsumer) {
    FrameBuffer<int> buf(1);
    std::atomic<bool> popped{true};
    std::thread consumer([&] {
        int out = 0;
        popped = buf.pop(out);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    buf.stop();
    consumer.join();
    EXPECT_FALSE(popped);
}

TEST(FrameBufferTest, StopReleasesBlockedProducer) {
    FrameBuffer<int> buf(1);
    ASSERT_TRUE(buf.push(1));
    std::atomic<bool> pushed{true};
    std::thread producer([&] { pushed = buf.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    buf.stop();
    producer.join();
    EXPECT_FALSE(pushed);
    EXPECT_EQ(buf.size(), 1u);
}

TEST(FrameBufferTest, BlockedProducerResumesAfterPop) {
    FrameBuffer<int> buf(1);
    ASSERT_TRUE(buf.push(1));
    std::thread producer([&] { EXPECT_TRUE(buf.push(2)); });
    int out = 0;
    ASSERT_TRUE(buf.pop(out));
    EXPECT_EQ(out, 1);
    ASSERT_TRUE(buf.pop(out));
    EXPECT_EQ(out, 2);
    producer.join();
}
