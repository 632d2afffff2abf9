#pragma once

#include "Entity.h"
#include "Uid.h"
#include <juce_core/juce_core.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace model {

// Owns every entity in the project and the track <-> entity cross references.
// All lookups go through ids; entities never point at each other or at tracks.
class EntityRepository
{
public:
    using ProxyEventFn = std::function<void(Uid source, const WorkEvent& event)>;

    EntityRepository() = default;

    // Appends entity to track's chain. The entity keeps its own uid if it
    // already has one, otherwise a new one is minted. The current sample rate,
    // tempo and time signature are pushed to it before it is stored.
    juce::Result addEntity(TrackUid track, std::unique_ptr<Entity> entity, Uid* assignedUid = nullptr);

    // Moves uid to newTrack (appending) and/or to newPosition within its
    // track. Every check happens before anything is changed.
    juce::Result moveEntity(Uid uid, std::optional<TrackUid> newTrack, std::optional<int> newPosition);

    // Hands ownership back to the caller
    juce::Result removeEntity(Uid uid, std::unique_ptr<Entity>& removed);
    juce::Result deleteEntity(Uid uid);

    // Deletes every entity on track. Returns the uids that were deleted.
    std::vector<Uid> deleteEntitiesForTrack(TrackUid track);

    Entity* getEntity(Uid uid);
    const Entity* getEntity(Uid uid) const;
    bool contains(Uid uid) const { return entities_.find(uid) != entities_.end(); }
    int getEntityCount() const { return static_cast<int>(entities_.size()); }

    const std::vector<Uid>& getEntitiesForTrack(TrackUid track) const;
    TrackUid getTrackForEntity(Uid uid) const;  // invalid TrackUid if none

    Uid mintUid() { return uidFactory_.mintNext(); }

    // Fan-out to every entity
    void play();
    void stop();
    void skipToStart();
    void reset();
    void updateTimeRange(const TimeRange& range);
    void updateSampleRate(double sampleRate);
    void updateTempo(Tempo tempo);
    void updateTimeSignature(TimeSignature timeSignature);
    void beforeSer();
    void afterDeser();

    // True only when every entity is finished
    bool isFinished() const;

    // Runs work() on every entity once, forwarding each event with its source
    void workAsProxy(const ProxyEventFn& fn);

    void clear();

private:
    UidFactory<Uid> uidFactory_;
    std::map<Uid, std::unique_ptr<Entity>> entities_;
    std::map<TrackUid, std::vector<Uid>> uidsForTrack_;
    std::map<Uid, TrackUid> trackForUid_;

    double sampleRate_ = DEFAULT_SAMPLE_RATE;
    Tempo tempo_;
    TimeSignature timeSignature_;
};

} // namespace model
