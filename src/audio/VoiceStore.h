#pragma once

#include "Voice.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <functional>
#include <map>
#include <memory>
#include <type_traits>
#include <vector>

namespace audio {

// Maps notes to voices. Each strategy decides what happens when a note
// arrives and no voice is free.
template <typename V>
class VoiceStore
{
    static_assert(std::is_base_of<Voice, V>::value, "V must derive from audio::Voice");

public:
    static constexpr int MAX_BLOCK_SIZE = 1024;

    virtual ~VoiceStore() = default;

    // On success voice points at the voice to use for note
    virtual juce::Result getVoice(int note, V*& voice) = 0;

    virtual int voiceCount() const = 0;
    virtual V* getVoiceAt(int index) = 0;

    int activeVoiceCount()
    {
        int count = 0;
        for (int i = 0; i < voiceCount(); ++i)
        {
            if (getVoiceAt(i)->isPlaying())
                ++count;
        }
        return count;
    }

    void setSampleRate(double sampleRate)
    {
        for (int i = 0; i < voiceCount(); ++i)
            getVoiceAt(i)->setSampleRate(sampleRate);
    }

    // Sums every playing voice into buffer. Returns whether any voice played.
    virtual bool generate(juce::AudioBuffer<float>& buffer)
    {
        bool madeSound = false;
        const int numSamples = buffer.getNumSamples();
        for (int i = 0; i < voiceCount(); ++i)
        {
            auto* voice = getVoiceAt(i);
            if (!voice->isPlaying())
                continue;

            renderVoice(*voice, buffer, numSamples);
            madeSound = true;
        }
        return madeSound;
    }

protected:
    void renderVoice(V& voice, juce::AudioBuffer<float>& buffer, int numSamples)
    {
        scratch_.setSize(2, numSamples, false, false, true);

        // Cleared per voice so nothing leaks from the previous one
        scratch_.clear();
        voice.render(scratch_.getWritePointer(0), scratch_.getWritePointer(1), numSamples);

        const int numChannels = buffer.getNumChannels();
        buffer.addFrom(0, 0, scratch_, 0, 0, numSamples);
        if (numChannels > 1)
            buffer.addFrom(1, 0, scratch_, 1, 0, numSamples);
    }

    juce::AudioBuffer<float> scratch_ { 2, MAX_BLOCK_SIZE };
};

// Fixed-size pool shared by the fixed and stealing strategies. notesPlaying_
// is parallel to voices_ and holds -1 for a voice with no note.
template <typename V>
class PooledVoiceStore : public VoiceStore<V>
{
public:
    static constexpr int NO_NOTE = -1;

    explicit PooledVoiceStore(std::vector<std::unique_ptr<V>> voices)
        : voices_(std::move(voices)), notesPlaying_(voices_.size(), NO_NOTE) {}

    int voiceCount() const override { return static_cast<int>(voices_.size()); }
    V* getVoiceAt(int index) override { return voices_[static_cast<size_t>(index)].get(); }

    const std::vector<int>& getNotesPlaying() const { return notesPlaying_; }

    bool generate(juce::AudioBuffer<float>& buffer) override
    {
        const bool madeSound = VoiceStore<V>::generate(buffer);

        // Voices that went idle while rendering give up their note
        for (size_t i = 0; i < voices_.size(); ++i)
        {
            if (!voices_[i]->isPlaying())
                notesPlaying_[i] = NO_NOTE;
        }
        return madeSound;
    }

protected:
    // A voice already on this note, else the first idle voice
    V* findVoice(int note)
    {
        for (size_t i = 0; i < voices_.size(); ++i)
        {
            if (notesPlaying_[i] == note)
                return voices_[i].get();
        }

        for (size_t i = 0; i < voices_.size(); ++i)
        {
            if (!voices_[i]->isPlaying() && notesPlaying_[i] == NO_NOTE)
            {
                notesPlaying_[i] = note;
                return voices_[i].get();
            }
        }
        return nullptr;
    }

    std::vector<std::unique_ptr<V>> voices_;
    std::vector<int> notesPlaying_;
};

// Fails with "Out of voices" when every voice is busy
template <typename V>
class FixedVoiceStore : public PooledVoiceStore<V>
{
public:
    explicit FixedVoiceStore(std::vector<std::unique_ptr<V>> voices)
        : PooledVoiceStore<V>(std::move(voices)) {}

    juce::Result getVoice(int note, V*& voice) override
    {
        voice = this->findVoice(note);
        if (voice == nullptr)
            return juce::Result::fail("Out of voices");
        return juce::Result::ok();
    }
};

// Picks the slot to reassign when a stealing store is full
using StealPolicy = std::function<int(const std::vector<int>& notesPlaying)>;

inline int stealFirstSlot(const std::vector<int>&)
{
    return 0;
}

// Never fails: when every voice is busy one is taken over according to the
// steal policy, and the voice handles its own shutdown and retrigger.
template <typename V>
class StealingVoiceStore : public PooledVoiceStore<V>
{
public:
    explicit StealingVoiceStore(std::vector<std::unique_ptr<V>> voices, StealPolicy policy = stealFirstSlot)
        : PooledVoiceStore<V>(std::move(voices)), policy_(std::move(policy)) {}

    void setStealPolicy(StealPolicy policy) { policy_ = std::move(policy); }

    juce::Result getVoice(int note, V*& voice) override
    {
        voice = this->findVoice(note);
        if (voice != nullptr)
            return juce::Result::ok();

        if (this->voices_.empty())
            return juce::Result::fail("Out of voices");

        int slot = policy_ ? policy_(this->notesPlaying_) : 0;
        slot = juce::jlimit(0, this->voiceCount() - 1, slot);
        this->notesPlaying_[static_cast<size_t>(slot)] = note;
        voice = this->voices_[static_cast<size_t>(slot)].get();
        return juce::Result::ok();
    }

private:
    StealPolicy policy_;
};

// One voice permanently bound to each note, e.g. the pads of a drum kit
template <typename V>
class VoicePerNoteStore : public VoiceStore<V>
{
public:
    VoicePerNoteStore() = default;

    void addVoice(int note, std::unique_ptr<V> voice)
    {
        auto* raw = voice.get();
        auto it = voices_.find(note);
        if (it != voices_.end())
        {
            for (auto& ordered : ordered_)
            {
                if (ordered == it->second.get())
                    ordered = raw;
            }
            it->second = std::move(voice);
        }
        else
        {
            voices_.emplace(note, std::move(voice));
            ordered_.push_back(raw);
        }
    }

    juce::Result getVoice(int note, V*& voice) override
    {
        auto it = voices_.find(note);
        if (it == voices_.end())
        {
            voice = nullptr;
            return juce::Result::fail("No voice for note");
        }
        voice = it->second.get();
        return juce::Result::ok();
    }

    int voiceCount() const override { return static_cast<int>(ordered_.size()); }
    V* getVoiceAt(int index) override { return ordered_[static_cast<size_t>(index)]; }

private:
    std::map<int, std::unique_ptr<V>> voices_;
    std::vector<V*> ordered_;
};

} // namespace audio
