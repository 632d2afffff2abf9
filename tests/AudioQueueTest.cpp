#include <gtest/gtest.h>
#include "../src/audio/AudioQueue.h"
#include <vector>

using namespace audio;

// Behind: ask for twice the need
TEST(AudioQueueTest, RequestCatchesUpWhenShort) {
    EXPECT_EQ(AudioQueue::computeFramesRequest(100, 256, 1024), 512);
}

// Comfortable: ask for exactly the need
TEST(AudioQueueTest, RequestMatchesNeed) {
    EXPECT_EQ(AudioQueue::computeFramesRequest(256, 256, 1024), 256);
    EXPECT_EQ(AudioQueue::computeFramesRequest(512, 256, 1024), 256);
}

// Far ahead: back off to half
TEST(AudioQueueTest, RequestBacksOffWhenAhead) {
    EXPECT_EQ(AudioQueue::computeFramesRequest(513, 256, 1024), 128);
}

TEST(AudioQueueTest, RequestNeverExceedsPeriod) {
    EXPECT_EQ(AudioQueue::computeFramesRequest(0, 512, 512), 512);
    EXPECT_EQ(AudioQueue::computeFramesRequest(0, 512, 300), 300);
    EXPECT_EQ(AudioQueue::computeFramesRequest(0, 0, 512), 0);
}

TEST(AudioQueueTest, PushThenPopKeepsChannels) {
    AudioQueue queue(8);
    const std::vector<float> left { 1.0f, 2.0f, 3.0f };
    const std::vector<float> right { -1.0f, -2.0f, -3.0f };
    EXPECT_EQ(queue.push(left.data(), right.data(), 3), 3);
    EXPECT_EQ(queue.getNumReady(), 3);

    std::vector<float> outL(3, 0.0f), outR(3, 0.0f);
    EXPECT_EQ(queue.pop(outL.data(), outR.data(), 3), 3);
    EXPECT_EQ(outL, left);
    EXPECT_EQ(outR, right);
    EXPECT_EQ(queue.getNumReady(), 0);
}

// The queue holds exactly its capacity; the rest of a push is dropped
TEST(AudioQueueTest, PushStopsAtCapacity) {
    AudioQueue queue(4);
    EXPECT_EQ(queue.getCapacity(), 4);
    EXPECT_EQ(queue.getFreeSpace(), 4);

    const std::vector<float> samples { 1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f };
    EXPECT_EQ(queue.push(samples.data(), samples.data(), 6), 4);
    EXPECT_EQ(queue.getFreeSpace(), 0);
    EXPECT_EQ(queue.push(samples.data(), samples.data(), 1), 0);
}

// Reading past what is queued returns only what was there
TEST(AudioQueueTest, PopReturnsWhatIsAvailable) {
    AudioQueue queue(8);
    const std::vector<float> samples { 0.5f, 0.5f };
    queue.push(samples.data(), nullptr, 2);

    std::vector<float> out(4, 0.0f);
    EXPECT_EQ(queue.pop(out.data(), nullptr, 4), 2);
    EXPECT_FLOAT_EQ(out[1], 0.5f);
    EXPECT_FLOAT_EQ(out[2], 0.0f);
}

// Wrapping around the end of the ring keeps frame order
TEST(AudioQueueTest, WrapsAround) {
    AudioQueue queue(4);
    std::vector<float> out(4, 0.0f);

    const std::vector<float> first { 1.0f, 2.0f, 3.0f };
    queue.push(first.data(), first.data(), 3);
    queue.pop(out.data(), nullptr, 2);

    const std::vector<float> second { 4.0f, 5.0f, 6.0f };
    EXPECT_EQ(queue.push(second.data(), second.data(), 3), 3);

    EXPECT_EQ(queue.pop(out.data(), out.data(), 4), 4);
    EXPECT_EQ(out, (std::vector<float> { 3.0f, 4.0f, 5.0f, 6.0f }));
}

TEST(AudioQueueTest, PushFromBuffer) {
    juce::AudioBuffer<float> buffer(2, 16);
    buffer.clear();
    buffer.setSample(0, 0, 0.25f);
    buffer.setSample(1, 0, -0.25f);

    AudioQueue queue(32);
    EXPECT_EQ(queue.push(buffer, 64), 16) << "Never reads past the buffer";

    float l = 0.0f, r = 0.0f;
    ASSERT_EQ(queue.pop(&l, &r, 1), 1);
    EXPECT_FLOAT_EQ(l, 0.25f);
    EXPECT_FLOAT_EQ(r, -0.25f);

    queue.reset();
    EXPECT_EQ(queue.getNumReady(), 0);
}
