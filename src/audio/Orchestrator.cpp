#include "Orchestrator.h"
#include <algorithm>

namespace audio {

Orchestrator::Orchestrator(int renderChunkSize)
    : renderChunkSize_(std::max(1, renderChunkSize))
{
    chunkBuffer_.setSize(NUM_CHANNELS, renderChunkSize_);
    humidifier_.prepare(NUM_CHANNELS, renderChunkSize_);
    entityEvents_.reserve(64);
    pathEvents_.reserve(16);
}

//==============================================================================
// Tracks

model::TrackUid Orchestrator::createTrack()
{
    auto uid = tracks_.createTrack();
    trackBuffers_[uid].setSize(NUM_CHANNELS, renderChunkSize_);
    return uid;
}

model::TrackUid Orchestrator::createAuxTrack()
{
    auto uid = createTrack();
    auxTrackUids_.insert(uid);
    return uid;
}

juce::Result Orchestrator::insertTrack(model::TrackUid uid, bool isAux)
{
    auto result = tracks_.insertTrack(uid);
    if (result.failed())
        return result;

    trackBuffers_[uid].setSize(NUM_CHANNELS, renderChunkSize_);
    if (isAux)
        auxTrackUids_.insert(uid);
    return juce::Result::ok();
}

juce::Result Orchestrator::deleteTrack(model::TrackUid track)
{
    auto result = tracks_.deleteTrack(track);
    if (result.failed())
        return result;

    for (auto uid : entities_.deleteEntitiesForTrack(track))
        forgetEntity(uid);

    busStation_.removeSendsForTrack(track);
    mixer_.removeTrack(track);
    auxTrackUids_.erase(track);
    trackBuffers_.erase(track);
    return juce::Result::ok();
}

juce::Result Orchestrator::setTrackPosition(model::TrackUid track, int newPosition)
{
    return tracks_.setTrackPosition(track, newPosition);
}

//==============================================================================
// Entities

juce::Result Orchestrator::addEntity(model::TrackUid track, std::unique_ptr<model::Entity> entity,
                                     model::Uid* assignedUid)
{
    if (!tracks_.contains(track))
        return juce::Result::fail("Track not found");

    model::Uid uid;
    auto result = entities_.addEntity(track, std::move(entity), &uid);
    if (result.failed())
        return result;

    // Late arrivals join a performance already in progress
    if (transport_.isPerforming())
    {
        if (auto* added = entities_.getEntity(uid))
            added->play();
    }

    if (assignedUid != nullptr)
        *assignedUid = uid;
    return juce::Result::ok();
}

juce::Result Orchestrator::moveEntity(model::Uid uid, std::optional<model::TrackUid> newTrack,
                                      std::optional<int> newPosition)
{
    if (newTrack.has_value() && !tracks_.contains(*newTrack))
        return juce::Result::fail("Track not found");

    return entities_.moveEntity(uid, newTrack, newPosition);
}

juce::Result Orchestrator::removeEntity(model::Uid uid, std::unique_ptr<model::Entity>& removed)
{
    auto result = entities_.removeEntity(uid, removed);
    if (result.wasOk())
        forgetEntity(uid);
    return result;
}

juce::Result Orchestrator::deleteEntity(model::Uid uid)
{
    std::unique_ptr<model::Entity> removed;
    return removeEntity(uid, removed);
}

void Orchestrator::forgetEntity(model::Uid uid)
{
    midiRouter_.setMidiReceiverChannel(uid, std::nullopt);
    humidifier_.removeEntity(uid);
}

//==============================================================================
// Routing

juce::Result Orchestrator::addSend(model::TrackUid source, model::TrackUid auxTrack, float amount)
{
    if (!tracks_.contains(source) || !tracks_.contains(auxTrack))
        return juce::Result::fail("Track not found");
    if (!isAuxTrack(auxTrack))
        return juce::Result::fail("Send destination is not an aux track");
    if (source == auxTrack)
        return juce::Result::fail("Track cannot send to itself");

    busStation_.addSend(source, auxTrack, juce::jlimit(0.0f, 1.0f, amount));
    return juce::Result::ok();
}

juce::Result Orchestrator::link(model::Uid source, model::Uid target, model::ControlIndex param)
{
    if (!entities_.contains(source) || !entities_.contains(target))
        return juce::Result::fail("Entity not found");

    automator_.link(source, target, param);
    return juce::Result::ok();
}

juce::Result Orchestrator::setMidiReceiverChannel(model::Uid uid, std::optional<model::MidiChannel> channel)
{
    if (!entities_.contains(uid))
        return juce::Result::fail("Entity not found");
    if (channel.has_value() && (*channel < 0 || *channel >= model::MIDI_CHANNEL_COUNT))
        return juce::Result::fail("Invalid MIDI channel");

    midiRouter_.setMidiReceiverChannel(uid, channel);
    return juce::Result::ok();
}

juce::Result Orchestrator::routeMidi(model::MidiChannel channel, const juce::MidiMessage& message)
{
    return midiRouter_.route(entities_, channel, message);
}

void Orchestrator::allNotesOff()
{
    midiRouter_.allNotesOff(entities_);
}

//==============================================================================
// Transport

void Orchestrator::play()
{
    transport_.play();
    entities_.play();
}

void Orchestrator::stop()
{
    const bool wasPerforming = transport_.isPerforming();
    transport_.stop();
    entities_.stop();

    if (wasPerforming)
        allNotesOff();
    else
        skipToStart();
}

void Orchestrator::skipToStart()
{
    transport_.skipToStart();
    entities_.skipToStart();
    automator_.reset();
}

void Orchestrator::updateSampleRate(double sampleRate)
{
    transport_.updateSampleRate(sampleRate);
    entities_.updateSampleRate(sampleRate);
}

void Orchestrator::updateTempo(model::Tempo tempo)
{
    tempo.bpm = juce::jlimit(model::Tempo::MIN_BPM, model::Tempo::MAX_BPM, tempo.bpm);
    transport_.updateTempo(tempo);
    entities_.updateTempo(tempo);
}

juce::Result Orchestrator::updateTimeSignature(model::TimeSignature timeSignature)
{
    auto result = timeSignature.isValid();
    if (result.failed())
        return result;

    transport_.updateTimeSignature(timeSignature);
    entities_.updateTimeSignature(timeSignature);
    return juce::Result::ok();
}

//==============================================================================
// Rendering

bool Orchestrator::render(juce::AudioBuffer<float>& output)
{
    output.clear();

    const int totalSamples = output.getNumSamples();
    const int numChannels = std::min(output.getNumChannels(), NUM_CHANNELS);
    bool madeSound = false;

    for (int offset = 0; offset < totalSamples; offset += renderChunkSize_)
    {
        const int numSamples = std::min(renderChunkSize_, totalSamples - offset);
        chunkBuffer_.setSize(NUM_CHANNELS, numSamples, false, false, true);
        chunkBuffer_.clear();

        handleControllers(numSamples);
        if (generate(chunkBuffer_))
            madeSound = true;

        for (int ch = 0; ch < numChannels; ++ch)
            output.copyFrom(ch, offset, chunkBuffer_, ch, 0, numSamples);
    }
    return madeSound;
}

void Orchestrator::handleControllers(int frameCount)
{
    const bool wasFinished = entities_.isFinished();

    const auto range = transport_.advance(frameCount);
    entities_.updateTimeRange(range);
    automator_.updateTimeRange(range);

    // Collect first, then dispatch, so no entity is re-entered during its own work()
    entityEvents_.clear();
    pathEvents_.clear();
    entities_.workAsProxy([this](model::Uid source, const model::WorkEvent& event)
    {
        entityEvents_.emplace_back(source, event);
    });
    automator_.workAsProxy([this](model::PathUid source, const model::WorkEvent& event)
    {
        pathEvents_.emplace_back(source, event);
    });

    dispatchPendingEvents();

    if (transport_.isPerforming() && !wasFinished && entities_.isFinished())
        stop();
}

void Orchestrator::dispatchPendingEvents()
{
    auto notFound = [](model::Uid target)
    {
        DBG("Control link target " << target.toString() << " no longer exists");
        juce::ignoreUnused(target);
    };

    for (const auto& [source, event] : entityEvents_)
    {
        if (event.type == model::WorkEvent::Type::Control)
        {
            automator_.route(entities_, notFound, ControlLinkSource(source), event.value);
        }
        else
        {
            auto result = midiRouter_.route(entities_, event.channel, event.message);
            if (result.failed())
                DBG("MIDI from " << source.toString() << ": " << result.getErrorMessage());
            if (midiOut_)
                midiOut_(event.channel, event.message);
        }
    }

    for (const auto& [path, event] : pathEvents_)
    {
        if (event.type == model::WorkEvent::Type::Control)
            automator_.route(entities_, notFound, ControlLinkSource(path), event.value);
    }
}

juce::AudioBuffer<float>& Orchestrator::prepareTrackBuffer(model::TrackUid track, int numSamples)
{
    auto& buffer = trackBuffers_[track];
    buffer.setSize(NUM_CHANNELS, numSamples, false, false, true);
    buffer.clear();
    return buffer;
}

void Orchestrator::runChain(model::TrackUid track, juce::AudioBuffer<float>& buffer, bool generateAudio)
{
    for (auto uid : entities_.getEntitiesForTrack(track))
    {
        auto* entity = entities_.getEntity(uid);
        if (entity == nullptr)
            continue;

        if (generateAudio)
            entity->generate(buffer);

        if (entity->isEffect())
        {
            const float humidity = humidifier_.getHumidity(uid);
            if (humidity != 0.0f)
                humidifier_.transformBatch(humidity, *entity, buffer);
        }
    }
}

bool Orchestrator::generate(juce::AudioBuffer<float>& output)
{
    const int numSamples = output.getNumSamples();
    const auto& trackUids = tracks_.getTrackUids();

    for (auto track : trackUids)
        prepareTrackBuffer(track, numSamples);

    // Instruments and their effect chains
    for (auto track : trackUids)
    {
        if (isAuxTrack(track) || !mixer_.isTrackAudible(track))
            continue;
        runChain(track, trackBuffers_[track], true);
    }

    // Bus sends into aux tracks
    for (const auto& [source, routes] : busStation_.getSends())
    {
        auto sourceIt = trackBuffers_.find(source);
        if (sourceIt == trackBuffers_.end())
            continue;

        for (const auto& route : routes)
        {
            auto auxIt = trackBuffers_.find(route.auxTrack);
            if (auxIt == trackBuffers_.end())
                continue;

            for (int ch = 0; ch < NUM_CHANNELS; ++ch)
                auxIt->second.addFrom(ch, 0, sourceIt->second, ch, 0, numSamples, route.amount);
        }
    }

    // Aux effect chains
    for (auto track : trackUids)
    {
        if (isAuxTrack(track) && mixer_.isTrackAudible(track))
            runChain(track, trackBuffers_[track], false);
    }

    // Final mix
    const int numChannels = std::min(output.getNumChannels(), NUM_CHANNELS);
    for (auto track : trackUids)
    {
        if (!mixer_.isTrackAudible(track))
            continue;

        const float level = mixer_.getTrackOutput(track);
        const auto& buffer = trackBuffers_[track];
        for (int ch = 0; ch < numChannels; ++ch)
            output.addFrom(ch, 0, buffer, ch, 0, numSamples, level);
    }

    for (int ch = 0; ch < numChannels; ++ch)
    {
        if (output.getMagnitude(ch, 0, numSamples) > 0.0f)
            return true;
    }
    return false;
}

//==============================================================================
// Persistence

void Orchestrator::beforeSer()
{
    entities_.beforeSer();
}

void Orchestrator::afterDeser()
{
    entities_.afterDeser();
    automator_.afterDeser();
    midiRouter_.afterDeser();
}

void Orchestrator::reset()
{
    entities_.reset();
    automator_.reset();
}

void Orchestrator::clear()
{
    if (transport_.isPerforming())
        transport_.stop();
    transport_.skipToStart();

    entities_.clear();
    tracks_.clear();

    auxTrackUids_.clear();
    busStation_.clear();
    humidifier_.clear();
    mixer_.clear();
    automator_.clear();
    midiRouter_.clear();
    trackBuffers_.clear();
}

} // namespace audio
