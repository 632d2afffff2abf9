#include "Mixer.h"

namespace audio {

float Mixer::getTrackOutput(model::TrackUid track) const
{
    auto it = trackOutputs_.find(track);
    return it != trackOutputs_.end() ? it->second : DEFAULT_OUTPUT;
}

void Mixer::setTrackOutput(model::TrackUid track, float output)
{
    trackOutputs_[track] = juce::jlimit(0.0f, 1.0f, output);
}

bool Mixer::isTrackMuted(model::TrackUid track) const
{
    auto it = trackMutes_.find(track);
    return it != trackMutes_.end() && it->second;
}

void Mixer::setTrackMuted(model::TrackUid track, bool muted)
{
    trackMutes_[track] = muted;
}

bool Mixer::isTrackAudible(model::TrackUid track) const
{
    if (isTrackMuted(track))
        return false;
    return !soloTrack_.has_value() || *soloTrack_ == track;
}

void Mixer::removeTrack(model::TrackUid track)
{
    trackOutputs_.erase(track);
    trackMutes_.erase(track);
    if (soloTrack_.has_value() && *soloTrack_ == track)
        soloTrack_.reset();
}

void Mixer::clear()
{
    trackOutputs_.clear();
    trackMutes_.clear();
    soloTrack_.reset();
}

float Humidifier::getHumidity(model::Uid uid) const
{
    auto it = humidities_.find(uid);
    return it != humidities_.end() ? it->second : DEFAULT_HUMIDITY;
}

void Humidifier::setHumidity(model::Uid uid, float humidity)
{
    humidities_[uid] = juce::jlimit(0.0f, 1.0f, humidity);
}

void Humidifier::prepare(int numChannels, int maxSamples)
{
    dryBuffer_.setSize(numChannels, maxSamples, false, true, true);
}

void Humidifier::transformBatch(float humidity, model::Entity& entity, juce::AudioBuffer<float>& buffer)
{
    if (humidity <= 0.0f)
        return;

    if (humidity >= 1.0f)
    {
        entity.transform(buffer);
        return;
    }

    const int numChannels = buffer.getNumChannels();
    const int numSamples = buffer.getNumSamples();
    dryBuffer_.setSize(numChannels, numSamples, false, false, true);
    for (int ch = 0; ch < numChannels; ++ch)
        dryBuffer_.copyFrom(ch, 0, buffer, ch, 0, numSamples);

    entity.transform(buffer);

    for (int ch = 0; ch < numChannels; ++ch)
    {
        buffer.applyGain(ch, 0, numSamples, humidity);
        buffer.addFrom(ch, 0, dryBuffer_, ch, 0, numSamples, 1.0f - humidity);
    }
}

} // namespace audio
