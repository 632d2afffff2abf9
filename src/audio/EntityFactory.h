#pragma once

#include "../model/Entity.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace audio {

// Builds entities from a type key. The engine core never names concrete
// device types; everything it owns comes through here.
class EntityFactory
{
public:
    using Creator = std::function<std::unique_ptr<model::Entity>()>;

    // Replaces any creator already registered under key
    void registerEntity(const std::string& key, Creator creator);
    bool isRegistered(const std::string& key) const { return creators_.count(key) > 0; }

    // nullptr if key is unknown
    std::unique_ptr<model::Entity> create(const std::string& key) const;

    // Sorted
    std::vector<std::string> getKeys() const;

private:
    std::map<std::string, Creator> creators_;
};

// tone-synth, drum-kit, gain, pattern-sequencer, lfo
void registerBuiltInEntities(EntityFactory& factory);

} // namespace audio
