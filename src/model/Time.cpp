#include "Time.h"
#include <cmath>

namespace model {

juce::Result TimeSignature::isValid() const
{
    if (top <= 0)
        return juce::Result::fail("Invalid time signature");

    // 1, 2, 4, ... 512
    if (bottom < 1 || bottom > 512 || !juce::isPowerOfTwo(bottom))
        return juce::Result::fail("Invalid time signature");

    return juce::Result::ok();
}

MusicalTime MusicalTime::fromBars(const TimeSignature& ts, uint64_t bars)
{
    return fromBeats(bars * static_cast<uint64_t>(ts.top));
}

MusicalTime MusicalTime::fromFrames(const Tempo& tempo, double sampleRate, uint64_t frames)
{
    if (sampleRate <= 0.0)
        return MusicalTime();

    const double beats = (static_cast<double>(frames) / sampleRate) * tempo.bps();
    const double wholeBeats = std::floor(beats);
    const double fraction = beats - wholeBeats;

    const auto units = static_cast<uint64_t>(wholeBeats) * UNITS_IN_BEAT
                     + static_cast<uint64_t>(fraction * static_cast<double>(UNITS_IN_BEAT) + 0.5);
    return MusicalTime(units);
}

uint64_t MusicalTime::toFrames(const Tempo& tempo, double sampleRate) const
{
    if (tempo.bps() <= 0.0)
        return 0;

    const double framesPerBeat = sampleRate / tempo.bps();
    const double beats = static_cast<double>(units_) / static_cast<double>(UNITS_IN_BEAT);
    return static_cast<uint64_t>(framesPerBeat * beats + 0.5);
}

uint64_t MusicalTime::bars(const TimeSignature& ts) const
{
    return totalBeats() / static_cast<uint64_t>(ts.top);
}

uint64_t MusicalTime::beatInBar(const TimeSignature& ts) const
{
    return totalBeats() % static_cast<uint64_t>(ts.top);
}

MusicalTime MusicalTime::quantizedToBar(const TimeSignature& ts) const
{
    const uint64_t barUnits = static_cast<uint64_t>(ts.top) * UNITS_IN_BEAT;
    if (barUnits == 0)
        return *this;

    const uint64_t remainder = units_ % barUnits;
    if (remainder == 0)
        return *this;
    return MusicalTime(units_ - remainder + barUnits);
}

juce::String MusicalTime::toString() const
{
    return juce::String(static_cast<juce::int64>(totalBeats())) + "."
         + juce::String(static_cast<int>(partsInBeat())) + "."
         + juce::String(static_cast<int>(unitsInPart()));
}

MusicalTime MusicalTime::operator+(const MusicalTime& o) const
{
    if (units_ > std::numeric_limits<uint64_t>::max() - o.units_)
        return max();
    return MusicalTime(units_ + o.units_);
}

MusicalTime MusicalTime::operator-(const MusicalTime& o) const
{
    return units_ >= o.units_ ? MusicalTime(units_ - o.units_) : MusicalTime();
}

} // namespace model
