#pragma once

#include "../model/Entity.h"
#include "../model/Uid.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <map>
#include <optional>

namespace audio {

// Per-track output level, mute and a single solo track
class Mixer
{
public:
    static constexpr float DEFAULT_OUTPUT = 1.0f;

    float getTrackOutput(model::TrackUid track) const;
    void setTrackOutput(model::TrackUid track, float output);

    bool isTrackMuted(model::TrackUid track) const;
    void setTrackMuted(model::TrackUid track, bool muted);

    std::optional<model::TrackUid> getSoloTrack() const { return soloTrack_; }
    void setSoloTrack(std::optional<model::TrackUid> track) { soloTrack_ = track; }

    // Audible iff not muted, and either nothing is soloed or track is the solo
    bool isTrackAudible(model::TrackUid track) const;

    void removeTrack(model::TrackUid track);

    const std::map<model::TrackUid, float>& getTrackOutputs() const { return trackOutputs_; }
    const std::map<model::TrackUid, bool>& getTrackMutes() const { return trackMutes_; }

    void clear();

private:
    std::map<model::TrackUid, float> trackOutputs_;
    std::map<model::TrackUid, bool> trackMutes_;
    std::optional<model::TrackUid> soloTrack_;
};

// Wet/dry balance applied around each entity's transform
class Humidifier
{
public:
    static constexpr float DEFAULT_HUMIDITY = 1.0f;

    float getHumidity(model::Uid uid) const;
    void setHumidity(model::Uid uid, float humidity);
    void removeEntity(model::Uid uid) { humidities_.erase(uid); }

    // post * humidity + pre * (1 - humidity). Zero humidity skips the effect.
    void transformBatch(float humidity, model::Entity& entity, juce::AudioBuffer<float>& buffer);

    const std::map<model::Uid, float>& getHumidities() const { return humidities_; }

    void prepare(int numChannels, int maxSamples);
    void clear() { humidities_.clear(); }

private:
    std::map<model::Uid, float> humidities_;
    juce::AudioBuffer<float> dryBuffer_;
};

} // namespace audio
