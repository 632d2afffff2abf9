// Tempo-synced LFO used as a control source

#pragma once

#include <cstdint>

namespace dsp {

enum class LfoShape {
    Triangle = 0,
    Saw,
    Square,
    Sine,
    NumShapes
};

// Period of one cycle, in beats
enum class LfoRateDivision {
    Div_1_16 = 0,
    Div_1_8,
    Div_1_4,
    Div_1_2,
    Div_1_1,
    Div_2_1,
    Div_4_1,
    NumDivisions
};

class Lfo {
public:
    void setRate(LfoRateDivision division) { division_ = division; }
    void setShape(LfoShape shape) { shape_ = shape; }

    LfoRateDivision getRate() const { return division_; }
    LfoShape getShape() const { return shape_; }

    // Phase from an absolute beat position, so the LFO follows the transport
    // exactly. Returns -1..1.
    float valueAtBeat(double beats) const;

    static double getDivisionBeats(LfoRateDivision division);
    static const char* getRateName(LfoRateDivision division);
    static const char* getShapeName(LfoShape shape);

private:
    float computeWaveform(float phase) const;

    LfoRateDivision division_ = LfoRateDivision::Div_1_4;
    LfoShape shape_ = LfoShape::Triangle;
};

} // namespace dsp
