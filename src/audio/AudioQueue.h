#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <vector>

namespace audio {

// Fixed-capacity ring of stereo frames between the render thread (producer)
// and the device callback (consumer). Lock-free for one producer and one
// consumer.
class AudioQueue
{
public:
    explicit AudioQueue(int capacityFrames);

    // Copies up to numFrames frames. Returns how many fit; the rest are dropped.
    int push(const float* left, const float* right, int numFrames);
    int push(const juce::AudioBuffer<float>& buffer, int numFrames);

    // Copies up to numFrames frames out. Either pointer may be null to discard
    // that channel. Returns how many were available.
    int pop(float* left, float* right, int numFrames);

    int getNumReady() const { return fifo_.getNumReady(); }
    int getFreeSpace() const { return fifo_.getFreeSpace(); }
    int getCapacity() const { return capacity_; }

    // Only safe while neither side is running
    void reset() { fifo_.reset(); }

    // Frames to ask the renderer for after a callback that needs needFrames
    // while haveFrames are queued. Catches up when short, backs off when far
    // ahead, and never asks for more than one period.
    static int computeFramesRequest(int haveFrames, int needFrames, int periodSize);

private:
    int capacity_;
    juce::AbstractFifo fifo_;
    std::vector<float> left_;
    std::vector<float> right_;

    JUCE_DECLARE_NON_COPYABLE(AudioQueue)
};

} // namespace audio
