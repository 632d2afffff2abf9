#include "ToneSynth.h"
#include <algorithm>
#include <cmath>

namespace audio {

// 1ms to 2000ms, exponential
static float mapAttackSeconds(float normalized)
{
    return (1.0f + std::pow(normalized, 2.0f) * 1999.0f) / 1000.0f;
}

// 1ms to 5000ms, exponential
static float mapReleaseSeconds(float normalized)
{
    return (1.0f + std::pow(normalized, 2.0f) * 4999.0f) / 1000.0f;
}

static dsp::Waveform mapWaveform(float normalized)
{
    const int count = static_cast<int>(dsp::Waveform::NumWaveforms);
    const int index = juce::jlimit(0, count - 1, static_cast<int>(normalized * static_cast<float>(count)));
    return static_cast<dsp::Waveform>(index);
}

static const char* kParameterNames[] = {
    "gain", "pan", "attack", "release", "waveform"
};

//==============================================================================
// ToneVoice

void ToneVoice::setSampleRate(double sampleRate)
{
    oscillator_.setSampleRate(static_cast<float>(sampleRate));
    envelope_.setSampleRate(static_cast<float>(sampleRate));
}

void ToneVoice::noteOn(int note, float velocity)
{
    if (isPlaying())
    {
        // Fade the old note out first, the new one starts once it is silent
        stealPending_ = true;
        pendingNote_ = note;
        pendingVelocity_ = velocity;
        envelope_.shutdown();
        return;
    }
    start(note, velocity);
}

void ToneVoice::noteOff(float velocity)
{
    (void)velocity;
    if (stealPending_)
    {
        // Released before it ever sounded
        stealPending_ = false;
        return;
    }
    envelope_.release();
}

void ToneVoice::aftertouch(float pressure)
{
    pressure_ = juce::jlimit(0.0f, 1.0f, pressure);
}

void ToneVoice::setPitchBend(float semitones)
{
    pitchBend_ = semitones;
    updateFrequency();
}

void ToneVoice::render(float* outL, float* outR, int numSamples)
{
    for (int i = 0; i < numSamples; ++i)
    {
        if (stealPending_ && !envelope_.isActive())
        {
            stealPending_ = false;
            start(pendingNote_, pendingVelocity_);
        }

        if (!envelope_.isActive())
            continue;

        const float env = envelope_.process();
        const float level = env * velocity_ * (1.0f + 0.5f * pressure_) * 0.5f;
        const float sample = oscillator_.process() * level;
        outL[i] += sample;
        outR[i] += sample;
    }
}

void ToneVoice::start(int note, float velocity)
{
    note_ = note;
    velocity_ = juce::jlimit(0.0f, 1.0f, velocity);
    pressure_ = 0.0f;
    updateFrequency();
    oscillator_.reset();
    envelope_.trigger();
}

void ToneVoice::updateFrequency()
{
    if (note_ < 0)
        return;
    oscillator_.setFrequency(dsp::Oscillator::noteToFrequency(static_cast<float>(note_) + pitchBend_));
}

//==============================================================================
// ToneSynth

static std::vector<std::unique_ptr<ToneVoice>> makeToneVoices()
{
    std::vector<std::unique_ptr<ToneVoice>> voices;
    for (int i = 0; i < ToneSynth::NUM_VOICES; ++i)
        voices.push_back(std::make_unique<ToneVoice>());
    return voices;
}

ToneSynth::ToneSynth()
    : synth_(std::make_unique<StealingVoiceStore<ToneVoice>>(makeToneVoices()))
{
    params_[kGain] = 0.5f;
    params_[kPan] = 0.5f;
    params_[kAttack] = 0.05f;
    params_[kRelease] = 0.2f;
    params_[kWaveform] = 0.0f;
    applyVoiceSettings();
    synth_.setSampleRate(sampleRate_);
}

void ToneSynth::updateSampleRate(double sampleRate)
{
    Entity::updateSampleRate(sampleRate);
    synth_.setSampleRate(sampleRate);
}

const char* ToneSynth::getParameterName(int index) const
{
    if (index < 0 || index >= kNumParameters)
        return "";
    return kParameterNames[index];
}

model::ControlValue ToneSynth::getParameter(int index) const
{
    if (index < 0 || index >= kNumParameters)
        return 0.0f;
    return params_[static_cast<size_t>(index)];
}

void ToneSynth::setParameter(int index, model::ControlValue value)
{
    if (index < 0 || index >= kNumParameters)
        return;
    params_[static_cast<size_t>(index)] = juce::jlimit(0.0f, 1.0f, value);
    applyVoiceSettings();
}

void ToneSynth::handleMidiMessage(model::MidiChannel channel, const juce::MidiMessage& message,
                                  const model::MidiMessagesFn& fn)
{
    (void)channel;
    (void)fn;
    synth_.handleMidiMessage(message);
}

bool ToneSynth::generate(juce::AudioBuffer<float>& buffer)
{
    return synth_.generate(buffer);
}

void ToneSynth::stop()
{
    Entity::stop();
    synth_.handleMidiMessage(juce::MidiMessage::allNotesOff(1));
}

void ToneSynth::applyVoiceSettings()
{
    synth_.setGain(params_[kGain]);
    synth_.setPan(params_[kPan] * 2.0f - 1.0f);

    dsp::AdsrEnvelope::Params env;
    env.attack = mapAttackSeconds(params_[kAttack]);
    env.release = mapReleaseSeconds(params_[kRelease]);
    const auto waveform = mapWaveform(params_[kWaveform]);

    auto& store = synth_.getVoiceStore();
    for (int i = 0; i < store.voiceCount(); ++i)
    {
        auto* voice = store.getVoiceAt(i);
        voice->setEnvelope(env);
        voice->setWaveform(waveform);
    }
}

} // namespace audio
