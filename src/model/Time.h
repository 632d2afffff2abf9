#pragma once

#include <juce_core/juce_core.h>
#include <cstdint>
#include <limits>

namespace model {

constexpr double DEFAULT_SAMPLE_RATE = 44100.0;

// Beats per minute
struct Tempo
{
    static constexpr double DEFAULT_BPM = 128.0;
    static constexpr double MIN_BPM = 0.0;
    static constexpr double MAX_BPM = 1024.0;

    double bpm = DEFAULT_BPM;

    Tempo() = default;
    explicit Tempo(double beatsPerMinute) : bpm(beatsPerMinute) {}

    double bps() const { return bpm / 60.0; }

    bool operator==(const Tempo& other) const { return bpm == other.bpm; }
    bool operator!=(const Tempo& other) const { return bpm != other.bpm; }
};

struct TimeSignature
{
    int top = 4;
    int bottom = 4;

    TimeSignature() = default;
    TimeSignature(int t, int b) : top(t), bottom(b) {}

    // Top must be nonzero; bottom a power of two in [1, 512]
    juce::Result isValid() const;

    bool operator==(const TimeSignature& other) const { return top == other.top && bottom == other.bottom; }
    bool operator!=(const TimeSignature& other) const { return !(*this == other); }
};

// Sample-accurate position in musical time. One beat is 65536 units.
class MusicalTime
{
public:
    static constexpr uint64_t PARTS_IN_BEAT = 16;
    static constexpr uint64_t UNITS_IN_PART = 4096;
    static constexpr uint64_t UNITS_IN_BEAT = PARTS_IN_BEAT * UNITS_IN_PART;

    constexpr MusicalTime() = default;
    constexpr explicit MusicalTime(uint64_t units) : units_(units) {}

    static constexpr MusicalTime start() { return MusicalTime(0); }
    static constexpr MusicalTime max() { return MusicalTime(std::numeric_limits<uint64_t>::max()); }

    static MusicalTime fromBars(const TimeSignature& ts, uint64_t bars);
    static MusicalTime fromBeats(uint64_t beats) { return MusicalTime(beats * UNITS_IN_BEAT); }
    static MusicalTime fromParts(uint64_t parts) { return MusicalTime(parts * UNITS_IN_PART); }
    static MusicalTime fromUnits(uint64_t units) { return MusicalTime(units); }

    // 16 parts per beat, so a sixteenth note in 4/4 is 4 parts
    static MusicalTime sixteenth() { return fromParts(PARTS_IN_BEAT / 4); }

    static MusicalTime fromFrames(const Tempo& tempo, double sampleRate, uint64_t frames);
    uint64_t toFrames(const Tempo& tempo, double sampleRate) const;

    uint64_t totalUnits() const { return units_; }
    uint64_t totalBeats() const { return units_ / UNITS_IN_BEAT; }
    uint64_t totalParts() const { return units_ / UNITS_IN_PART; }
    uint64_t bars(const TimeSignature& ts) const;
    uint64_t beatInBar(const TimeSignature& ts) const;
    uint64_t partsInBeat() const { return (units_ / UNITS_IN_PART) % PARTS_IN_BEAT; }
    uint64_t unitsInPart() const { return units_ % UNITS_IN_PART; }

    // Rounds up to the next whole bar (no-op on a bar boundary)
    MusicalTime quantizedToBar(const TimeSignature& ts) const;

    juce::String toString() const;

    constexpr bool operator==(const MusicalTime& o) const { return units_ == o.units_; }
    constexpr bool operator!=(const MusicalTime& o) const { return units_ != o.units_; }
    constexpr bool operator<(const MusicalTime& o) const { return units_ < o.units_; }
    constexpr bool operator<=(const MusicalTime& o) const { return units_ <= o.units_; }
    constexpr bool operator>(const MusicalTime& o) const { return units_ > o.units_; }
    constexpr bool operator>=(const MusicalTime& o) const { return units_ >= o.units_; }

    // Saturating, so TIME_MAX + x stays TIME_MAX
    MusicalTime operator+(const MusicalTime& o) const;
    // Clamps at zero
    MusicalTime operator-(const MusicalTime& o) const;
    MusicalTime& operator+=(const MusicalTime& o) { *this = *this + o; return *this; }

private:
    uint64_t units_ = 0;
};

// Half-open interval [start, end)
struct TimeRange
{
    MusicalTime start;
    MusicalTime end;

    TimeRange() = default;
    TimeRange(MusicalTime s, MusicalTime e) : start(s), end(e) {}

    bool contains(const MusicalTime& t) const { return t >= start && t < end; }
    bool isEmpty() const { return end <= start; }
    MusicalTime length() const { return end - start; }

    bool operator==(const TimeRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const TimeRange& o) const { return !(*this == o); }
};

} // namespace model
