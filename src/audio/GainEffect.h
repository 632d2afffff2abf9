// GainEffect - scales the track signal in place

#pragma once

#include "../model/Entity.h"

namespace audio {

class GainEffect : public model::Entity {
public:
    static constexpr const char* TYPE_NAME = "gain";

    enum Parameter {
        kGain = 0,
        kNumParameters
    };

    GainEffect() = default;
    explicit GainEffect(float gain) : gain_(juce::jlimit(0.0f, 1.0f, gain)) {}

    const char* getTypeName() const override { return TYPE_NAME; }

    int getNumParameters() const override { return kNumParameters; }
    const char* getParameterName(int index) const override { return index == kGain ? "gain" : ""; }
    model::ControlValue getParameter(int index) const override { return index == kGain ? gain_ : 0.0f; }
    void setParameter(int index, model::ControlValue value) override {
        if (index == kGain) gain_ = juce::jlimit(0.0f, 1.0f, value);
    }

    bool isEffect() const override { return true; }
    void transform(juce::AudioBuffer<float>& buffer) override {
        buffer.applyGain(gain_);
    }

private:
    float gain_ = 1.0f;
};

} // namespace audio
