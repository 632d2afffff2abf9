// Tempo-synced LFO used as a control source

#include "lfo.h"
#include <cmath>

namespace dsp {

// Quarter note = 1 beat
static const double kDivisionBeats[] = {
    0.25,   // 1/16
    0.5,    // 1/8
    1.0,    // 1/4
    2.0,    // 1/2
    4.0,    // 1 bar
    8.0,    // 2 bars
    16.0,   // 4 bars
};

static const char* kRateNames[] = {
    "1/16", "1/8", "1/4", "1/2", "1", "2", "4"
};

static const char* kShapeNames[] = {
    "TRI", "SAW", "SQR", "SIN"
};

double Lfo::getDivisionBeats(LfoRateDivision division)
{
    int index = static_cast<int>(division);
    if (index >= 0 && index < static_cast<int>(LfoRateDivision::NumDivisions)) {
        return kDivisionBeats[index];
    }
    return 1.0;
}

float Lfo::valueAtBeat(double beats) const
{
    const double cycle = beats / getDivisionBeats(division_);
    const auto phase = static_cast<float>(cycle - std::floor(cycle));
    return computeWaveform(phase);
}

float Lfo::computeWaveform(float phase) const
{
    switch (shape_) {
        case LfoShape::Triangle:
            // 0 -> 1 -> -1 -> 0 over one cycle
            if (phase < 0.25f) {
                return phase * 4.0f;
            } else if (phase < 0.75f) {
                return 1.0f - (phase - 0.25f) * 4.0f;
            }
            return -1.0f + (phase - 0.75f) * 4.0f;

        case LfoShape::Saw:
            return 1.0f - phase * 2.0f;

        case LfoShape::Square:
            return phase < 0.5f ? 1.0f : -1.0f;

        case LfoShape::Sine:
            return std::sin(phase * 6.28318530718f);

        default:
            return 0.0f;
    }
}

const char* Lfo::getRateName(LfoRateDivision division)
{
    int index = static_cast<int>(division);
    if (index >= 0 && index < static_cast<int>(LfoRateDivision::NumDivisions)) {
        return kRateNames[index];
    }
    return "???";
}

const char* Lfo::getShapeName(LfoShape shape)
{
    int index = static_cast<int>(shape);
    if (index >= 0 && index < static_cast<int>(LfoShape::NumShapes)) {
        return kShapeNames[index];
    }
    return "???";
}

} // namespace dsp
