#pragma once

#include "Time.h"
#include "Uid.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <functional>

namespace model {

// 0..15
using MidiChannel = int;
constexpr int MIDI_CHANNEL_COUNT = 16;

// Normalized 0..1
using ControlValue = float;
using ControlIndex = int;

// Something an entity produced during work(): a MIDI message to route, or a
// control value for whatever it is linked to.
struct WorkEvent
{
    enum class Type { Midi, Control };

    Type type = Type::Control;
    MidiChannel channel = 0;
    juce::MidiMessage message;
    ControlValue value = 0.0f;

    static WorkEvent midi(MidiChannel channel, const juce::MidiMessage& message)
    {
        WorkEvent e;
        e.type = Type::Midi;
        e.channel = channel;
        e.message = message;
        return e;
    }

    static WorkEvent control(ControlValue value)
    {
        WorkEvent e;
        e.type = Type::Control;
        e.value = value;
        return e;
    }
};

using WorkEventFn = std::function<void(const WorkEvent&)>;
using MidiMessagesFn = std::function<void(MidiChannel, const juce::MidiMessage&)>;

// Base class for every device the engine owns: instruments, effects and
// controllers. Capabilities a device does not have keep the defaults.
class Entity
{
public:
    virtual ~Entity() = default;

    Uid getUid() const { return uid_; }
    void setUid(Uid uid) { uid_ = uid; }

    // Key the entity was registered under in the EntityFactory
    virtual const char* getTypeName() const = 0;

    // Configuration
    virtual void updateSampleRate(double sampleRate) { sampleRate_ = sampleRate; }
    virtual void updateTempo(Tempo tempo) { tempo_ = tempo; }
    virtual void updateTimeSignature(TimeSignature timeSignature) { timeSignature_ = timeSignature; }
    double getSampleRate() const { return sampleRate_; }
    Tempo getTempo() const { return tempo_; }
    TimeSignature getTimeSignature() const { return timeSignature_; }

    // Lifecycle, driven once per buffer by the orchestrator
    virtual void updateTimeRange(const TimeRange& /*range*/) {}
    virtual void work(const WorkEventFn& /*eventFn*/) {}
    virtual bool isFinished() const { return true; }
    virtual void play() { performing_ = true; }
    virtual void stop() { performing_ = false; }
    virtual void skipToStart() {}
    virtual void reset() {}
    bool isPerforming() const { return performing_; }

    // Automatable parameters, values normalized 0..1
    virtual int getNumParameters() const { return 0; }
    virtual const char* getParameterName(int /*index*/) const { return ""; }
    virtual ControlValue getParameter(int /*index*/) const { return 0.0f; }
    virtual void setParameter(int /*index*/, ControlValue /*value*/) {}

    // Messages sent through fn are routed onward by the MidiRouter
    virtual void handleMidiMessage(MidiChannel /*channel*/, const juce::MidiMessage& /*message*/,
                                   const MidiMessagesFn& /*fn*/) {}

    // Instruments add their output into buffer and report whether they made sound.
    // Effects process buffer in place.
    virtual bool generate(juce::AudioBuffer<float>& /*buffer*/) { return false; }
    virtual bool isEffect() const { return false; }
    virtual void transform(juce::AudioBuffer<float>& /*buffer*/) {}

    // Persistence hooks
    virtual void beforeSer() {}
    virtual void afterDeser() {}
    virtual juce::var getState() const { return {}; }
    virtual void setState(const juce::var& /*state*/) {}

protected:
    double sampleRate_ = DEFAULT_SAMPLE_RATE;
    Tempo tempo_;
    TimeSignature timeSignature_;
    bool performing_ = false;

private:
    Uid uid_;
};

} // namespace model
