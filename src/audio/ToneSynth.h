// ToneSynth - polyphonic oscillator + ADSR instrument

#pragma once

#include "Synthesizer.h"
#include "Voice.h"
#include "../dsp/adsr_envelope.h"
#include "../dsp/oscillator.h"
#include "../model/Entity.h"
#include <array>

namespace audio {

class ToneVoice : public Voice {
public:
    ToneVoice() = default;

    void setSampleRate(double sampleRate) override;
    void noteOn(int note, float velocity) override;
    void noteOff(float velocity) override;
    void aftertouch(float pressure) override;
    void setPitchBend(float semitones) override;
    bool isPlaying() const override { return stealPending_ || envelope_.isActive(); }
    void render(float* outL, float* outR, int numSamples) override;

    void setWaveform(dsp::Waveform waveform) { oscillator_.setWaveform(waveform); }
    void setEnvelope(const dsp::AdsrEnvelope::Params& params) { envelope_.setParams(params); }

    int getNote() const { return note_; }
    bool isStealPending() const { return stealPending_; }

private:
    void start(int note, float velocity);
    void updateFrequency();

    dsp::Oscillator oscillator_;
    dsp::AdsrEnvelope envelope_;

    int note_ = -1;
    float velocity_ = 0.0f;
    float pressure_ = 0.0f;
    float pitchBend_ = 0.0f;

    // Set while the previous note is being shut down for a steal
    bool stealPending_ = false;
    int pendingNote_ = -1;
    float pendingVelocity_ = 0.0f;
};

class ToneSynth : public model::Entity {
public:
    static constexpr const char* TYPE_NAME = "tone-synth";
    static constexpr int NUM_VOICES = 8;

    enum Parameter {
        kGain = 0,
        kPan,
        kAttack,
        kRelease,
        kWaveform,
        kNumParameters
    };

    ToneSynth();
    ~ToneSynth() override = default;

    const char* getTypeName() const override { return TYPE_NAME; }

    void updateSampleRate(double sampleRate) override;

    int getNumParameters() const override { return kNumParameters; }
    const char* getParameterName(int index) const override;
    model::ControlValue getParameter(int index) const override;
    void setParameter(int index, model::ControlValue value) override;

    void handleMidiMessage(model::MidiChannel channel, const juce::MidiMessage& message,
                           const model::MidiMessagesFn& fn) override;
    bool generate(juce::AudioBuffer<float>& buffer) override;

    void stop() override;

    Synthesizer<ToneVoice>& getSynthesizer() { return synth_; }

private:
    void applyVoiceSettings();

    Synthesizer<ToneVoice> synth_;
    std::array<model::ControlValue, kNumParameters> params_;
};

} // namespace audio
