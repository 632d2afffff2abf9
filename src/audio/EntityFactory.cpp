#include "EntityFactory.h"
#include "DrumKit.h"
#include "GainEffect.h"
#include "LfoController.h"
#include "PatternSequencer.h"
#include "ToneSynth.h"

namespace audio {

void EntityFactory::registerEntity(const std::string& key, Creator creator)
{
    creators_[key] = std::move(creator);
}

std::unique_ptr<model::Entity> EntityFactory::create(const std::string& key) const
{
    auto it = creators_.find(key);
    if (it == creators_.end())
    {
        DBG("EntityFactory: unknown entity type " << juce::String(key));
        return nullptr;
    }
    return it->second();
}

std::vector<std::string> EntityFactory::getKeys() const
{
    std::vector<std::string> keys;
    keys.reserve(creators_.size());
    for (const auto& entry : creators_)
        keys.push_back(entry.first);
    return keys;
}

void registerBuiltInEntities(EntityFactory& factory)
{
    factory.registerEntity(ToneSynth::TYPE_NAME, [] { return std::make_unique<ToneSynth>(); });
    factory.registerEntity(DrumKit::TYPE_NAME, [] { return std::make_unique<DrumKit>(); });
    factory.registerEntity(GainEffect::TYPE_NAME, [] { return std::make_unique<GainEffect>(); });
    factory.registerEntity(PatternSequencer::TYPE_NAME, [] { return std::make_unique<PatternSequencer>(); });
    factory.registerEntity(LfoController::TYPE_NAME, [] { return std::make_unique<LfoController>(); });
}

} // namespace audio
