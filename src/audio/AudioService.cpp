#include "AudioService.h"
#include <algorithm>

namespace audio {

AudioService::AudioService(const EngineConfig& config)
    : periodSize_(std::max(1, config.periodSize)),
      queue_(config.getQueueCapacity())
{
}

int AudioService::pushFrames(const juce::AudioBuffer<float>& buffer, int numFrames)
{
    return queue_.push(buffer, numFrames);
}

void AudioService::audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                                    int numInputChannels,
                                                    float* const* outputChannelData,
                                                    int numOutputChannels,
                                                    int numSamples,
                                                    const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(inputChannelData, numInputChannels, context);
    fillOutput(outputChannelData, numOutputChannels, numSamples);
}

void AudioService::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const int channels = device->getActiveOutputChannels().countNumberOfSetBits();
    start(device->getCurrentSampleRate(), channels);
}

void AudioService::audioDeviceStopped()
{
}

void AudioService::start(double sampleRate, int channelCount)
{
    postEvent(Event::reset(sampleRate, channelCount));
    // Prime the renderer so the first callbacks have something to play
    postEvent(Event::framesNeeded(std::min(periodSize_, queue_.getFreeSpace())));
}

void AudioService::postEvent(const Event& event)
{
    // Never blocks; a full channel means the render thread is stalled
    if (!events_.push(event))
        droppedEvents_.fetch_add(1, std::memory_order_relaxed);
}

void AudioService::fillOutput(float* const* outputChannelData, int numOutputChannels, int numSamples)
{
    for (int ch = 0; ch < numOutputChannels; ++ch)
    {
        if (outputChannelData[ch] != nullptr)
            juce::FloatVectorOperations::clear(outputChannelData[ch], numSamples);
    }

    if (isPaused())
        return;

    const int have = queue_.getNumReady();
    const int request = AudioQueue::computeFramesRequest(have, numSamples, periodSize_);

    float* left = numOutputChannels > 0 ? outputChannelData[0] : nullptr;
    float* right = numOutputChannels > 1 ? outputChannelData[1] : nullptr;
    const int popped = queue_.pop(left, right, numSamples);

    // Whatever was not filled stays silent
    if (popped < numSamples)
        postEvent(Event::underrun());

    postEvent(Event::framesNeeded(std::min(request, queue_.getFreeSpace())));
}

} // namespace audio
