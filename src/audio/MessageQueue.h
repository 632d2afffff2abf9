#pragma once

#include <juce_core/juce_core.h>
#include <vector>

namespace audio {

// Bounded single-producer / single-consumer channel. Slots are allocated up
// front; push and pop only copy into and out of them.
template <typename T>
class MessageQueue
{
public:
    explicit MessageQueue(int capacity)
        : fifo_(capacity + 1), slots_(static_cast<size_t>(capacity + 1)) {}

    // False if the queue is full; the message is dropped
    bool push(const T& message)
    {
        int start1, size1, start2, size2;
        fifo_.prepareToWrite(1, start1, size1, start2, size2);
        if (size1 + size2 == 0)
            return false;

        slots_[static_cast<size_t>(size1 > 0 ? start1 : start2)] = message;
        fifo_.finishedWrite(1);
        return true;
    }

    bool pop(T& message)
    {
        int start1, size1, start2, size2;
        fifo_.prepareToRead(1, start1, size1, start2, size2);
        if (size1 + size2 == 0)
            return false;

        message = slots_[static_cast<size_t>(size1 > 0 ? start1 : start2)];
        fifo_.finishedRead(1);
        return true;
    }

    int getNumReady() const { return fifo_.getNumReady(); }
    bool isEmpty() const { return fifo_.getNumReady() == 0; }

    // Only safe while neither side is running
    void reset() { fifo_.reset(); }

private:
    juce::AbstractFifo fifo_;
    std::vector<T> slots_;

    JUCE_DECLARE_NON_COPYABLE(MessageQueue)
};

} // namespace audio
