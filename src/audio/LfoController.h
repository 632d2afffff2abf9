// LfoController - tempo-synced LFO as an automation source

#pragma once

#include "../dsp/lfo.h"
#include "../model/Entity.h"

namespace audio {

class LfoController : public model::Entity {
public:
    static constexpr const char* TYPE_NAME = "lfo";

    enum Parameter {
        kRate = 0,
        kShape,
        kNumParameters
    };

    LfoController() = default;

    const char* getTypeName() const override { return TYPE_NAME; }

    int getNumParameters() const override { return kNumParameters; }
    const char* getParameterName(int index) const override;
    model::ControlValue getParameter(int index) const override;
    void setParameter(int index, model::ControlValue value) override;

    void updateTimeRange(const model::TimeRange& range) override { timeRange_ = range; }
    // Sends the LFO value at the start of the current range, mapped to 0..1
    void work(const model::WorkEventFn& eventFn) override;

    dsp::Lfo& getLfo() { return lfo_; }

private:
    dsp::Lfo lfo_;
    model::TimeRange timeRange_;
};

} // namespace audio
