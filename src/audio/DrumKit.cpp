#include "DrumKit.h"
#include <algorithm>
#include <cmath>

namespace audio {

static const char* kParameterNames[] = { "gain", "pan" };

DrumVoice::DrumVoice(Kind kind)
    : kind_(kind)
{
    updateDecay();
}

void DrumVoice::setSampleRate(double sampleRate)
{
    sampleRate_ = sampleRate;
    updateDecay();
}

void DrumVoice::noteOn(int note, float velocity)
{
    (void)note;
    // Drums retrigger from the top; there is nothing to fade out first
    level_ = juce::jlimit(0.0f, 1.0f, velocity);
    phase_ = 0.0f;
    frequency_ = kind_ == Kind::Kick ? 150.0f : 0.0f;
}

void DrumVoice::noteOff(float velocity)
{
    // One-shot
    (void)velocity;
}

void DrumVoice::render(float* outL, float* outR, int numSamples)
{
    const float sr = static_cast<float>(sampleRate_);
    for (int i = 0; i < numSamples && isPlaying(); ++i)
    {
        float sample = 0.0f;
        switch (kind_)
        {
            case Kind::Kick:
                sample = std::sin(phase_ * juce::MathConstants<float>::twoPi);
                phase_ += frequency_ / sr;
                phase_ -= std::floor(phase_);
                // Exponential sweep down towards 45Hz
                frequency_ = 45.0f + (frequency_ - 45.0f) * sweep_;
                break;

            case Kind::Snare:
                sample = 0.7f * (random_.nextFloat() * 2.0f - 1.0f)
                       + 0.3f * std::sin(phase_ * juce::MathConstants<float>::twoPi);
                phase_ += 185.0f / sr;
                phase_ -= std::floor(phase_);
                break;

            case Kind::Hat:
                sample = 0.5f * (random_.nextFloat() * 2.0f - 1.0f);
                break;
        }

        sample *= level_;
        outL[i] += sample;
        outR[i] += sample;
        level_ *= decay_;
    }

    if (!isPlaying())
        level_ = 0.0f;
}

void DrumVoice::updateDecay()
{
    float seconds = 0.3f;
    switch (kind_)
    {
        case Kind::Kick:  seconds = 0.35f; break;
        case Kind::Snare: seconds = 0.18f; break;
        case Kind::Hat:   seconds = 0.05f; break;
    }

    // Time to fall by 60dB
    const float samples = std::max(1.0f, seconds * static_cast<float>(sampleRate_));
    decay_ = std::pow(0.001f, 1.0f / samples);
    sweep_ = std::pow(0.001f, 1.0f / std::max(1.0f, 0.05f * static_cast<float>(sampleRate_)));
}

//==============================================================================

static std::unique_ptr<VoicePerNoteStore<DrumVoice>> makeDrumStore()
{
    auto store = std::make_unique<VoicePerNoteStore<DrumVoice>>();
    store->addVoice(DrumKit::KICK_NOTE, std::make_unique<DrumVoice>(DrumVoice::Kind::Kick));
    store->addVoice(DrumKit::SNARE_NOTE, std::make_unique<DrumVoice>(DrumVoice::Kind::Snare));
    store->addVoice(DrumKit::HAT_NOTE, std::make_unique<DrumVoice>(DrumVoice::Kind::Hat));
    return store;
}

DrumKit::DrumKit()
    : synth_(makeDrumStore())
{
    synth_.setGain(0.8f);
    synth_.setSampleRate(sampleRate_);
}

void DrumKit::updateSampleRate(double sampleRate)
{
    Entity::updateSampleRate(sampleRate);
    synth_.setSampleRate(sampleRate);
}

const char* DrumKit::getParameterName(int index) const
{
    if (index < 0 || index >= kNumParameters)
        return "";
    return kParameterNames[index];
}

model::ControlValue DrumKit::getParameter(int index) const
{
    switch (index)
    {
        case kGain: return synth_.getGain();
        case kPan:  return (synth_.getPan() + 1.0f) * 0.5f;
        default:    return 0.0f;
    }
}

void DrumKit::setParameter(int index, model::ControlValue value)
{
    switch (index)
    {
        case kGain: synth_.setGain(value); break;
        case kPan:  synth_.setPan(value * 2.0f - 1.0f); break;
        default:    break;
    }
}

void DrumKit::handleMidiMessage(model::MidiChannel channel, const juce::MidiMessage& message,
                                const model::MidiMessagesFn& fn)
{
    (void)channel;
    (void)fn;
    synth_.handleMidiMessage(message);
}

bool DrumKit::generate(juce::AudioBuffer<float>& buffer)
{
    return synth_.generate(buffer);
}

} // namespace audio
