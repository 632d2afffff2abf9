#pragma once

#include "VoiceStore.h"
#include "../model/Entity.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>

namespace audio {

// Polyphonic MIDI instrument core. Owns a voice store and turns incoming
// MIDI into voice calls; instruments wrap one of these.
template <typename V>
class Synthesizer
{
public:
    static constexpr float PITCH_BEND_RANGE_SEMITONES = 2.0f;

    explicit Synthesizer(std::unique_ptr<VoiceStore<V>> store) : store_(std::move(store)) {}

    VoiceStore<V>& getVoiceStore() { return *store_; }

    void setSampleRate(double sampleRate)
    {
        sampleRate_ = sampleRate;
        store_->setSampleRate(sampleRate);
    }

    void handleMidiMessage(const juce::MidiMessage& message)
    {
        ticksSinceLastMidi_ = 0;

        if (message.isNoteOn())
        {
            if (auto* voice = voiceFor(message.getNoteNumber()))
                voice->noteOn(message.getNoteNumber(), message.getFloatVelocity());
        }
        else if (message.isNoteOff())
        {
            if (auto* voice = voiceFor(message.getNoteNumber()))
                voice->noteOff(message.getFloatVelocity());
        }
        else if (message.isAftertouch())
        {
            if (auto* voice = voiceFor(message.getNoteNumber()))
                voice->aftertouch(static_cast<float>(message.getAfterTouchValue()) / 127.0f);
        }
        else if (message.isAllNotesOff())
        {
            for (int i = 0; i < store_->voiceCount(); ++i)
                store_->getVoiceAt(i)->noteOff(0.0f);
        }
        else if (message.isPitchWheel())
        {
            // 0..16383, centre 8192
            pitchBend_ = static_cast<float>(message.getPitchWheelValue() - 8192) / 8192.0f;
            for (int i = 0; i < store_->voiceCount(); ++i)
                store_->getVoiceAt(i)->setPitchBend(pitchBend_ * PITCH_BEND_RANGE_SEMITONES);
        }
        else if (message.isChannelPressure())
        {
            channelAftertouch_ = static_cast<float>(message.getChannelPressureValue()) / 127.0f;
            for (int i = 0; i < store_->voiceCount(); ++i)
            {
                auto* voice = store_->getVoiceAt(i);
                if (voice->isPlaying())
                    voice->aftertouch(channelAftertouch_);
            }
        }
    }

    // Adds the voices into buffer with gain and pan applied
    bool generate(juce::AudioBuffer<float>& buffer)
    {
        const int numSamples = buffer.getNumSamples();
        ticksSinceLastMidi_ += numSamples;

        mixBuffer_.setSize(2, numSamples, false, false, true);
        mixBuffer_.clear();
        if (!store_->generate(mixBuffer_))
            return false;

        // Equal-power pan, -1 left .. 1 right
        const float angle = (pan_ + 1.0f) * juce::MathConstants<float>::pi * 0.25f;
        const float leftGain = gain_ * std::cos(angle) * juce::MathConstants<float>::sqrt2;
        const float rightGain = gain_ * std::sin(angle) * juce::MathConstants<float>::sqrt2;

        if (buffer.getNumChannels() > 1)
        {
            buffer.addFrom(0, 0, mixBuffer_, 0, 0, numSamples, leftGain);
            buffer.addFrom(1, 0, mixBuffer_, 1, 0, numSamples, rightGain);
        }
        else
        {
            buffer.addFrom(0, 0, mixBuffer_, 0, 0, numSamples, gain_);
        }
        return true;
    }

    // True if MIDI arrived within the last quarter second of rendered audio
    bool isMidiRecentlyActive() const
    {
        return static_cast<double>(ticksSinceLastMidi_) < sampleRate_ / 4.0;
    }

    float getPitchBend() const { return pitchBend_; }
    float getChannelAftertouch() const { return channelAftertouch_; }

    float getGain() const { return gain_; }
    void setGain(float gain) { gain_ = juce::jlimit(0.0f, 1.0f, gain); }
    float getPan() const { return pan_; }
    void setPan(float pan) { pan_ = juce::jlimit(-1.0f, 1.0f, pan); }

private:
    V* voiceFor(int note)
    {
        V* voice = nullptr;
        // Out of voices is not an error worth reporting: the note just doesn't sound
        if (store_->getVoice(note, voice).failed())
            return nullptr;
        return voice;
    }

    std::unique_ptr<VoiceStore<V>> store_;
    juce::AudioBuffer<float> mixBuffer_ { 2, VoiceStore<V>::MAX_BLOCK_SIZE };

    double sampleRate_ = model::DEFAULT_SAMPLE_RATE;
    // Starts far in the past so a fresh synth is not "recently active"
    int64_t ticksSinceLastMidi_ = std::numeric_limits<int32_t>::max();
    float pitchBend_ = 0.0f;
    float channelAftertouch_ = 0.0f;
    float gain_ = 1.0f;
    float pan_ = 0.0f;
};

} // namespace audio
