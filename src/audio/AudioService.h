#pragma once

#include "AudioQueue.h"
#include "EngineConfig.h"
#include "MessageQueue.h"
#include <juce_audio_devices/juce_audio_devices.h>
#include <atomic>

namespace audio {

// Device-side end of the real-time boundary. The device callback only pops
// rendered frames from the queue and reports what it needs next; rendering
// happens on the render thread, which drains getEvent() and answers with
// pushFrames().
class AudioService : public juce::AudioIODeviceCallback
{
public:
    static constexpr int EVENT_QUEUE_SIZE = 256;

    struct Event
    {
        enum class Type { Reset, FramesNeeded, Underrun };

        Type type = Type::FramesNeeded;
        double sampleRate = 0.0;
        int channelCount = 0;
        int frames = 0;

        static Event reset(double sampleRate, int channelCount)
        {
            Event e;
            e.type = Type::Reset;
            e.sampleRate = sampleRate;
            e.channelCount = channelCount;
            return e;
        }

        static Event framesNeeded(int frames)
        {
            Event e;
            e.type = Type::FramesNeeded;
            e.frames = frames;
            return e;
        }

        static Event underrun()
        {
            Event e;
            e.type = Type::Underrun;
            return e;
        }
    };

    explicit AudioService(const EngineConfig& config);
    ~AudioService() override = default;

    // Render thread side
    // Returns the frames that fit; anything beyond is an overrun and is dropped
    int pushFrames(const juce::AudioBuffer<float>& buffer, int numFrames);
    bool getEvent(Event& event) { return events_.pop(event); }

    // Paused output is silent and consumes nothing
    void setPaused(bool paused) { paused_.store(paused, std::memory_order_relaxed); }
    bool isPaused() const { return paused_.load(std::memory_order_relaxed); }

    int getPeriodSize() const { return periodSize_; }
    // Events lost because the render thread fell behind draining them
    int getDroppedEventCount() const { return droppedEvents_.load(std::memory_order_relaxed); }
    AudioQueue& getQueue() { return queue_; }

    // juce::AudioIODeviceCallback
    void audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                          int numInputChannels,
                                          float* const* outputChannelData,
                                          int numOutputChannels,
                                          int numSamples,
                                          const juce::AudioIODeviceCallbackContext& context) override;
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

    // The body of the device callback, callable without a device
    void fillOutput(float* const* outputChannelData, int numOutputChannels, int numSamples);
    // What audioDeviceAboutToStart does once it has the device's settings
    void start(double sampleRate, int channelCount);

private:
    void postEvent(const Event& event);

    int periodSize_;
    AudioQueue queue_;
    MessageQueue<Event> events_ { EVENT_QUEUE_SIZE };
    std::atomic<bool> paused_ { false };
    std::atomic<int> droppedEvents_ { 0 };
};

} // namespace audio
