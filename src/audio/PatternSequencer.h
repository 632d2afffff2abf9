// PatternSequencer - plays arranged patterns out as MIDI

#pragma once

#include "../model/Entity.h"
#include "../model/Pattern.h"
#include <vector>

namespace audio {

class PatternSequencer : public model::Entity {
public:
    static constexpr const char* TYPE_NAME = "pattern-sequencer";

    // A pattern copied into the sequencer at a fixed position. Later edits to
    // the source pattern do not affect it.
    struct Arrangement {
        model::MidiChannel channel = 0;
        model::MusicalTime position;
        model::Pattern pattern;
    };

    struct Event {
        model::MusicalTime when;
        model::MidiChannel channel = 0;
        juce::MidiMessage message;
    };

    PatternSequencer() = default;

    const char* getTypeName() const override { return TYPE_NAME; }

    // Places pattern at position, sending on channel
    void record(model::MidiChannel channel, const model::Pattern& pattern, model::MusicalTime position);
    // Places patterns back to back starting at position. Returns the end time.
    model::MusicalTime recordSequence(model::MidiChannel channel, const std::vector<model::Pattern>& patterns,
                                      model::MusicalTime position);
    bool removeArrangement(int index);
    void clear();

    const std::vector<Arrangement>& getArrangements() const { return arrangements_; }
    const std::vector<Event>& getEvents() const { return events_; }
    // Time of the last scheduled event
    model::MusicalTime getMaxEventTime() const { return maxEventTime_; }

    void updateTimeRange(const model::TimeRange& range) override { timeRange_ = range; }
    void work(const model::WorkEventFn& eventFn) override;
    bool isFinished() const override;
    void skipToStart() override { timeRange_ = model::TimeRange(); }

    juce::var getState() const override;
    void setState(const juce::var& state) override;

private:
    void rebuildEvents();

    std::vector<Arrangement> arrangements_;
    std::vector<Event> events_;
    model::MusicalTime maxEventTime_;
    model::TimeRange timeRange_;
};

} // namespace audio
