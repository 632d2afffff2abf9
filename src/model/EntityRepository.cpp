#include "EntityRepository.h"
#include <algorithm>

namespace model {

juce::Result EntityRepository::addEntity(TrackUid track, std::unique_ptr<Entity> entity, Uid* assignedUid)
{
    if (entity == nullptr)
        return juce::Result::fail("Entity is null");

    auto uid = entity->getUid();
    if (uid.isValid())
    {
        if (contains(uid))
        {
            DBG("Refusing to add entity " << uid.toString() << ": uid already in use");
            return juce::Result::fail("Duplicate entity uid");
        }
        uidFactory_.notifyExternallyMintedUid(uid);
    }
    else
    {
        uid = uidFactory_.mintNext();
        entity->setUid(uid);
    }

    entity->updateSampleRate(sampleRate_);
    entity->updateTimeSignature(timeSignature_);
    entity->updateTempo(tempo_);

    entities_[uid] = std::move(entity);
    uidsForTrack_[track].push_back(uid);
    trackForUid_[uid] = track;

    if (assignedUid != nullptr)
        *assignedUid = uid;
    return juce::Result::ok();
}

juce::Result EntityRepository::moveEntity(Uid uid, std::optional<TrackUid> newTrack, std::optional<int> newPosition)
{
    auto trackIt = trackForUid_.find(uid);
    if (!contains(uid) || trackIt == trackForUid_.end())
        return juce::Result::fail("Entity not found");

    const auto oldTrack = trackIt->second;
    const auto destination = newTrack.value_or(oldTrack);

    if (newPosition.has_value())
    {
        size_t destinationCount = 0;
        auto destIt = uidsForTrack_.find(destination);
        if (destIt != uidsForTrack_.end())
            destinationCount = destIt->second.size();

        if (*newPosition < 0 || static_cast<size_t>(*newPosition) > destinationCount)
            return juce::Result::fail("Position out of bounds");
    }

    // Checks passed; from here on nothing fails
    if (destination != oldTrack)
    {
        auto& oldUids = uidsForTrack_[oldTrack];
        oldUids.erase(std::remove(oldUids.begin(), oldUids.end(), uid), oldUids.end());
        uidsForTrack_[destination].push_back(uid);
        trackIt->second = destination;
    }

    if (newPosition.has_value())
    {
        auto& uids = uidsForTrack_[destination];
        uids.erase(std::remove(uids.begin(), uids.end(), uid), uids.end());
        auto position = std::min(static_cast<size_t>(*newPosition), uids.size());
        uids.insert(uids.begin() + static_cast<std::ptrdiff_t>(position), uid);
    }

    return juce::Result::ok();
}

juce::Result EntityRepository::removeEntity(Uid uid, std::unique_ptr<Entity>& removed)
{
    auto it = entities_.find(uid);
    if (it == entities_.end())
        return juce::Result::fail("Entity not found");

    removed = std::move(it->second);
    entities_.erase(it);

    auto trackIt = trackForUid_.find(uid);
    if (trackIt != trackForUid_.end())
    {
        auto& uids = uidsForTrack_[trackIt->second];
        uids.erase(std::remove(uids.begin(), uids.end(), uid), uids.end());
        trackForUid_.erase(trackIt);
    }
    return juce::Result::ok();
}

juce::Result EntityRepository::deleteEntity(Uid uid)
{
    std::unique_ptr<Entity> removed;
    return removeEntity(uid, removed);
}

std::vector<Uid> EntityRepository::deleteEntitiesForTrack(TrackUid track)
{
    std::vector<Uid> deleted;
    auto it = uidsForTrack_.find(track);
    if (it == uidsForTrack_.end())
        return deleted;

    deleted = it->second;
    for (auto uid : deleted)
    {
        entities_.erase(uid);
        trackForUid_.erase(uid);
    }
    uidsForTrack_.erase(it);
    return deleted;
}

Entity* EntityRepository::getEntity(Uid uid)
{
    auto it = entities_.find(uid);
    return it != entities_.end() ? it->second.get() : nullptr;
}

const Entity* EntityRepository::getEntity(Uid uid) const
{
    auto it = entities_.find(uid);
    return it != entities_.end() ? it->second.get() : nullptr;
}

const std::vector<Uid>& EntityRepository::getEntitiesForTrack(TrackUid track) const
{
    static const std::vector<Uid> empty;
    auto it = uidsForTrack_.find(track);
    return it != uidsForTrack_.end() ? it->second : empty;
}

TrackUid EntityRepository::getTrackForEntity(Uid uid) const
{
    auto it = trackForUid_.find(uid);
    return it != trackForUid_.end() ? it->second : TrackUid();
}

void EntityRepository::play()
{
    for (auto& [uid, entity] : entities_)
        entity->play();
}

void EntityRepository::stop()
{
    for (auto& [uid, entity] : entities_)
        entity->stop();
}

void EntityRepository::skipToStart()
{
    for (auto& [uid, entity] : entities_)
        entity->skipToStart();
}

void EntityRepository::reset()
{
    for (auto& [uid, entity] : entities_)
        entity->reset();
}

void EntityRepository::updateTimeRange(const TimeRange& range)
{
    for (auto& [uid, entity] : entities_)
        entity->updateTimeRange(range);
}

void EntityRepository::updateSampleRate(double sampleRate)
{
    sampleRate_ = sampleRate;
    for (auto& [uid, entity] : entities_)
        entity->updateSampleRate(sampleRate);
}

void EntityRepository::updateTempo(Tempo tempo)
{
    tempo_ = tempo;
    for (auto& [uid, entity] : entities_)
        entity->updateTempo(tempo);
}

void EntityRepository::updateTimeSignature(TimeSignature timeSignature)
{
    timeSignature_ = timeSignature;
    for (auto& [uid, entity] : entities_)
        entity->updateTimeSignature(timeSignature);
}

void EntityRepository::beforeSer()
{
    for (auto& [uid, entity] : entities_)
        entity->beforeSer();
}

void EntityRepository::afterDeser()
{
    for (auto& [uid, entity] : entities_)
    {
        uidFactory_.notifyExternallyMintedUid(uid);
        entity->afterDeser();
    }
}

bool EntityRepository::isFinished() const
{
    return std::all_of(entities_.begin(), entities_.end(),
                       [](const auto& pair) { return pair.second->isFinished(); });
}

void EntityRepository::workAsProxy(const ProxyEventFn& fn)
{
    for (auto& [uid, entity] : entities_)
    {
        const auto source = uid;
        entity->work([&fn, source](const WorkEvent& event) { fn(source, event); });
    }
}

void EntityRepository::clear()
{
    entities_.clear();
    uidsForTrack_.clear();
    trackForUid_.clear();
}

} // namespace model
