#include "AudioQueue.h"
#include <algorithm>
#include <cstring>

namespace audio {

// AbstractFifo keeps one slot empty, so it is sized one larger than the
// capacity we advertise
AudioQueue::AudioQueue(int capacityFrames)
    : capacity_(std::max(1, capacityFrames)),
      fifo_(capacity_ + 1),
      left_(static_cast<size_t>(capacity_ + 1), 0.0f),
      right_(static_cast<size_t>(capacity_ + 1), 0.0f)
{
}

int AudioQueue::push(const float* left, const float* right, int numFrames)
{
    if (numFrames <= 0)
        return 0;

    int start1, size1, start2, size2;
    fifo_.prepareToWrite(numFrames, start1, size1, start2, size2);

    const auto copyIn = [&](int dest, int src, int count) {
        std::memcpy(left_.data() + dest, left + src, static_cast<size_t>(count) * sizeof(float));
        std::memcpy(right_.data() + dest, (right != nullptr ? right : left) + src,
                    static_cast<size_t>(count) * sizeof(float));
    };

    if (size1 > 0)
        copyIn(start1, 0, size1);
    if (size2 > 0)
        copyIn(start2, size1, size2);

    const int written = size1 + size2;
    fifo_.finishedWrite(written);
    return written;
}

int AudioQueue::push(const juce::AudioBuffer<float>& buffer, int numFrames)
{
    if (buffer.getNumChannels() == 0)
        return 0;

    numFrames = std::min(numFrames, buffer.getNumSamples());
    const float* left = buffer.getReadPointer(0);
    const float* right = buffer.getNumChannels() > 1 ? buffer.getReadPointer(1) : left;
    return push(left, right, numFrames);
}

int AudioQueue::pop(float* left, float* right, int numFrames)
{
    if (numFrames <= 0)
        return 0;

    int start1, size1, start2, size2;
    fifo_.prepareToRead(numFrames, start1, size1, start2, size2);

    const auto copyOut = [&](int src, int dest, int count) {
        if (left != nullptr)
            std::memcpy(left + dest, left_.data() + src, static_cast<size_t>(count) * sizeof(float));
        if (right != nullptr)
            std::memcpy(right + dest, right_.data() + src, static_cast<size_t>(count) * sizeof(float));
    };

    if (size1 > 0)
        copyOut(start1, 0, size1);
    if (size2 > 0)
        copyOut(start2, size1, size2);

    const int read = size1 + size2;
    fifo_.finishedRead(read);
    return read;
}

int AudioQueue::computeFramesRequest(int haveFrames, int needFrames, int periodSize)
{
    int request = needFrames;
    if (haveFrames < needFrames)
        request = needFrames * 2;
    else if (haveFrames > needFrames * 2)
        request = needFrames / 2;

    return juce::jlimit(0, std::max(0, periodSize), request);
}

} // namespace audio
