#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "AudioRingBuffer.h"
#include "Queue.h"

using namespace std;

TEST(Queue, UnboundedKeepsEverything) {
    Queue<int> q;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(q.push(int{i}));
    }
    EXPECT_EQ(q.size(), 1000u);
    EXPECT_EQ(q.dropped(), 0u);
    EXPECT_EQ(q.capacity(), 0u);
}

TEST(Queue, BoundedDropsOldest) {
    Queue<int> q{3};
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_TRUE(q.push(3));
    EXPECT_FALSE(q.push(4));
    EXPECT_FALSE(q.push(5));
    EXPECT_EQ(q.dropped(), 2u);

    q.stop();
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 3);
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 4);
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 5);
    EXPECT_FALSE(q.pop(v));
}

TEST(Queue, StopWakesBlockedConsumer) {
    Queue<string> q;
    bool got = true;
    thread consumer([&] {
        string s;
        got = q.pop(s);
    });

    this_thread::sleep_for(20ms);
    q.stop();
    consumer.join();
    EXPECT_FALSE(got);
    EXPECT_TRUE(q.stopped());
}

TEST(Queue, PushAfterStopIsIgnored) {
    Queue<int> q;
    q.stop();
    q.push(7);
    EXPECT_EQ(q.size(), 0u);
}

TEST(Queue, ResetMakesItUsableAgain) {
    Queue<int> q{1};
    q.push(1);
    q.push(2);
    q.stop();

    q.reset();
    EXPECT_FALSE(q.stopped());
    EXPECT_EQ(q.size(), 0u);
    EXPECT_EQ(q.dropped(), 0u);

    q.push(3);
    q.stop();
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 3);
}

TEST(AudioRingBuffer, ZeroCapacityMeansOneChunk) {
    AudioRingBuffer ring{0};
    EXPECT_EQ(ring.capacity(), 1u);
    EXPECT_EQ(AudioRingBuffer{}.capacity(), AudioRingBuffer::default_max_chunks);
}
