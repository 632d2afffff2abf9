// DrumKit - synthesized kick, snare and hat, one voice per note

#pragma once

#include "Synthesizer.h"
#include "Voice.h"
#include "../model/Entity.h"
#include <juce_core/juce_core.h>

namespace audio {

class DrumVoice : public Voice {
public:
    enum class Kind { Kick, Snare, Hat };

    explicit DrumVoice(Kind kind);

    void setSampleRate(double sampleRate) override;
    void noteOn(int note, float velocity) override;
    void noteOff(float velocity) override;
    bool isPlaying() const override { return level_ > SILENCE; }
    void render(float* outL, float* outR, int numSamples) override;

    Kind getKind() const { return kind_; }

private:
    static constexpr float SILENCE = 1.0e-4f;

    void updateDecay();

    Kind kind_;
    double sampleRate_ = model::DEFAULT_SAMPLE_RATE;
    juce::Random random_ { 0x5eed };

    float level_ = 0.0f;
    float decay_ = 0.0f;
    float phase_ = 0.0f;
    float frequency_ = 0.0f;
    float sweep_ = 0.0f;
};

class DrumKit : public model::Entity {
public:
    static constexpr const char* TYPE_NAME = "drum-kit";

    // General MIDI drum map
    static constexpr int KICK_NOTE = 36;
    static constexpr int SNARE_NOTE = 38;
    static constexpr int HAT_NOTE = 42;

    enum Parameter {
        kGain = 0,
        kPan,
        kNumParameters
    };

    DrumKit();
    ~DrumKit() override = default;

    const char* getTypeName() const override { return TYPE_NAME; }

    void updateSampleRate(double sampleRate) override;

    int getNumParameters() const override { return kNumParameters; }
    const char* getParameterName(int index) const override;
    model::ControlValue getParameter(int index) const override;
    void setParameter(int index, model::ControlValue value) override;

    void handleMidiMessage(model::MidiChannel channel, const juce::MidiMessage& message,
                           const model::MidiMessagesFn& fn) override;
    bool generate(juce::AudioBuffer<float>& buffer) override;

    Synthesizer<DrumVoice>& getSynthesizer() { return synth_; }

private:
    Synthesizer<DrumVoice> synth_;
};

} // namespace audio
