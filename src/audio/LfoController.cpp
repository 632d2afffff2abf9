#include "LfoController.h"

namespace audio {

const char* LfoController::getParameterName(int index) const
{
    switch (index)
    {
        case kRate:  return "rate";
        case kShape: return "shape";
        default:     return "";
    }
}

model::ControlValue LfoController::getParameter(int index) const
{
    switch (index)
    {
        case kRate:
            return (static_cast<float>(lfo_.getRate()) + 0.5f)
                 / static_cast<float>(dsp::LfoRateDivision::NumDivisions);
        case kShape:
            return (static_cast<float>(lfo_.getShape()) + 0.5f)
                 / static_cast<float>(dsp::LfoShape::NumShapes);
        default:
            return 0.0f;
    }
}

void LfoController::setParameter(int index, model::ControlValue value)
{
    value = juce::jlimit(0.0f, 1.0f, value);
    switch (index)
    {
        case kRate:
        {
            const int count = static_cast<int>(dsp::LfoRateDivision::NumDivisions);
            const int i = juce::jlimit(0, count - 1, static_cast<int>(value * static_cast<float>(count)));
            lfo_.setRate(static_cast<dsp::LfoRateDivision>(i));
            break;
        }
        case kShape:
        {
            const int count = static_cast<int>(dsp::LfoShape::NumShapes);
            const int i = juce::jlimit(0, count - 1, static_cast<int>(value * static_cast<float>(count)));
            lfo_.setShape(static_cast<dsp::LfoShape>(i));
            break;
        }
        default:
            break;
    }
}

void LfoController::work(const model::WorkEventFn& eventFn)
{
    const double beats = static_cast<double>(timeRange_.start.totalUnits())
                       / static_cast<double>(model::MusicalTime::UNITS_IN_BEAT);
    const float value = lfo_.valueAtBeat(beats);
    eventFn(model::WorkEvent::control((value + 1.0f) * 0.5f));
}

} // namespace audio
