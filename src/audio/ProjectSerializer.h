#pragma once

#include "EntityFactory.h"
#include "Orchestrator.h"
#include <juce_core/juce_core.h>

namespace audio {

// Saves and loads a whole project as JSON. Entities are recreated through
// the factory under their saved uids.
class ProjectSerializer
{
public:
    static constexpr int VERSION = 1;

    static juce::Result save(Orchestrator& orchestrator, const juce::File& file);
    static juce::Result load(Orchestrator& orchestrator, const EntityFactory& factory, const juce::File& file);

    static juce::String toJson(Orchestrator& orchestrator);
    // On failure the orchestrator is left empty
    static juce::Result fromJson(Orchestrator& orchestrator, const EntityFactory& factory,
                                 const juce::String& json);

    static juce::var toVar(Orchestrator& orchestrator);
    static juce::Result fromVar(Orchestrator& orchestrator, const EntityFactory& factory, const juce::var& root);

private:
    static juce::var entityToVar(const Orchestrator& orchestrator, const model::Entity& entity);
    static juce::Result varToEntity(Orchestrator& orchestrator, const EntityFactory& factory,
                                    model::TrackUid track, const juce::var& v);

    static juce::var signalPathToVar(model::PathUid uid, const SignalPath& path, const Automator& automator,
                                     const model::EntityRepository& entities);
    static juce::Result varToSignalPath(Orchestrator& orchestrator, const juce::var& v);

    static juce::Result restore(Orchestrator& orchestrator, const EntityFactory& factory, const juce::var& root);
};

} // namespace audio
