#include <gtest/gtest.h>
#include "../src/audio/EntityFactory.h"
#include "../src/audio/GainEffect.h"
#include <memory>
#include <string>
#include <vector>

using namespace audio;

class EntityFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerBuiltInEntities(factory);
    }

    EntityFactory factory;
};

TEST_F(EntityFactoryTest, BuiltInKeysAreSorted) {
    const std::vector<std::string> expected { "drum-kit", "gain", "lfo", "pattern-sequencer", "tone-synth" };
    EXPECT_EQ(factory.getKeys(), expected);
}

// Each key builds the entity that reports the same type name back
TEST_F(EntityFactoryTest, CreatesByKey) {
    for (const auto& key : factory.getKeys()) {
        auto entity = factory.create(key);
        ASSERT_NE(entity, nullptr) << key;
        EXPECT_EQ(std::string(entity->getTypeName()), key);
        EXPECT_FALSE(entity->getUid().isValid()) << "Uids are assigned when an entity joins a project";
    }
}

TEST_F(EntityFactoryTest, UnknownKey) {
    EXPECT_FALSE(factory.isRegistered("theremin"));
    EXPECT_EQ(factory.create("theremin"), nullptr);
}

// Registering an existing key replaces its creator
TEST_F(EntityFactoryTest, RegisterReplaces) {
    factory.registerEntity("gain", [] { return std::make_unique<GainEffect>(0.25f); });
    EXPECT_EQ(factory.getKeys().size(), 5u);

    auto entity = factory.create("gain");
    ASSERT_NE(entity, nullptr);
    EXPECT_FLOAT_EQ(entity->getParameter(GainEffect::kGain), 0.25f);
}
