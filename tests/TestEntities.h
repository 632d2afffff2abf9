// Small entities used to observe the engine from tests

#pragma once

#include "../src/model/Entity.h"
#include <utility>
#include <vector>

namespace testentities {

// Accepts parameters and MIDI and remembers everything it was given
class RecordingEntity : public model::Entity {
public:
    explicit RecordingEntity(int numParameters = 4) : params(static_cast<size_t>(numParameters), 0.0f) {}

    const char* getTypeName() const override { return "recording"; }

    int getNumParameters() const override { return static_cast<int>(params.size()); }
    model::ControlValue getParameter(int index) const override {
        if (index < 0 || index >= getNumParameters())
            return 0.0f;
        return params[static_cast<size_t>(index)];
    }
    void setParameter(int index, model::ControlValue value) override {
        parameterCalls.emplace_back(index, value);
        if (index >= 0 && index < getNumParameters())
            params[static_cast<size_t>(index)] = value;
    }

    void handleMidiMessage(model::MidiChannel channel, const juce::MidiMessage& message,
                           const model::MidiMessagesFn& fn) override {
        juce::ignoreUnused(fn);
        received.emplace_back(channel, message);
    }

    std::vector<float> params;
    std::vector<std::pair<int, float>> parameterCalls;
    std::vector<std::pair<model::MidiChannel, juce::MidiMessage>> received;
};

// Passes every message it receives on to outChannel
class EchoEntity : public model::Entity {
public:
    explicit EchoEntity(model::MidiChannel out) : outChannel(out) {}

    const char* getTypeName() const override { return "echo"; }

    void handleMidiMessage(model::MidiChannel channel, const juce::MidiMessage& message,
                           const model::MidiMessagesFn& fn) override {
        juce::ignoreUnused(channel);
        ++receivedCount;
        fn(outChannel, message);
    }

    model::MidiChannel outChannel;
    int receivedCount = 0;
};

// Adds a fixed level to every sample it generates
class ConstantInstrument : public model::Entity {
public:
    explicit ConstantInstrument(float lvl) : level(lvl) {}

    const char* getTypeName() const override { return "constant"; }

    bool generate(juce::AudioBuffer<float>& buffer) override {
        for (int ch = 0; ch < buffer.getNumChannels(); ++ch) {
            auto* data = buffer.getWritePointer(ch);
            for (int i = 0; i < buffer.getNumSamples(); ++i)
                data[i] += level;
        }
        ++generateCount;
        return true;
    }

    float level;
    int generateCount = 0;
};

// Emits the same events on every work() call. Finished once it has run
// finishAfter times; the default of zero means always finished.
class ScriptedController : public model::Entity {
public:
    const char* getTypeName() const override { return "scripted"; }

    void work(const model::WorkEventFn& eventFn) override {
        ++workCount;
        for (const auto& event : events)
            eventFn(event);
    }
    bool isFinished() const override { return workCount >= finishAfter; }

    std::vector<model::WorkEvent> events;
    int finishAfter = 0;
    int workCount = 0;
};

} // namespace testentities
