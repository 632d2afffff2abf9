#include "PatternSequencer.h"
#include <algorithm>

namespace audio {

void PatternSequencer::record(model::MidiChannel channel, const model::Pattern& pattern,
                              model::MusicalTime position)
{
    Arrangement arrangement;
    arrangement.channel = juce::jlimit(0, model::MIDI_CHANNEL_COUNT - 1, channel);
    arrangement.position = position;
    arrangement.pattern = pattern;
    arrangements_.push_back(std::move(arrangement));
    rebuildEvents();
}

model::MusicalTime PatternSequencer::recordSequence(model::MidiChannel channel,
                                                    const std::vector<model::Pattern>& patterns,
                                                    model::MusicalTime position)
{
    for (const auto& pattern : patterns)
    {
        record(channel, pattern, position);
        position += pattern.getDuration();
    }
    return position;
}

bool PatternSequencer::removeArrangement(int index)
{
    if (index < 0 || index >= static_cast<int>(arrangements_.size()))
        return false;
    arrangements_.erase(arrangements_.begin() + index);
    rebuildEvents();
    return true;
}

void PatternSequencer::clear()
{
    arrangements_.clear();
    rebuildEvents();
}

void PatternSequencer::work(const model::WorkEventFn& eventFn)
{
    // A stopped transport still hands out a range; replaying it would repeat notes
    if (!isPerforming() || timeRange_.isEmpty())
        return;

    auto it = std::lower_bound(events_.begin(), events_.end(), timeRange_.start,
                               [](const Event& e, const model::MusicalTime& t) { return e.when < t; });
    for (; it != events_.end() && it->when < timeRange_.end; ++it)
        eventFn(model::WorkEvent::midi(it->channel, it->message));
}

bool PatternSequencer::isFinished() const
{
    if (events_.empty())
        return true;
    // Strictly past, so the final note-off has been sent
    return timeRange_.end > maxEventTime_;
}

void PatternSequencer::rebuildEvents()
{
    events_.clear();
    maxEventTime_ = model::MusicalTime::start();

    for (const auto& arrangement : arrangements_)
    {
        const int channel = arrangement.channel + 1;
        for (const auto& note : arrangement.pattern.getNotes())
        {
            const auto start = arrangement.position + note.start;
            const auto end = start + note.duration;
            events_.push_back({ start, arrangement.channel,
                                juce::MidiMessage::noteOn(channel, note.key, note.velocity) });
            events_.push_back({ end, arrangement.channel,
                                juce::MidiMessage::noteOff(channel, note.key, 0.0f) });
            maxEventTime_ = std::max(maxEventTime_, end);
        }
    }

    // Note-offs sort ahead of note-ons at the same instant so repeated notes retrigger
    std::stable_sort(events_.begin(), events_.end(), [](const Event& a, const Event& b) {
        if (a.when != b.when)
            return a.when < b.when;
        return a.message.isNoteOff() && !b.message.isNoteOff();
    });
}

//==============================================================================
// Persistence

juce::var PatternSequencer::getState() const
{
    juce::Array<juce::var> arrangements;
    for (const auto& arrangement : arrangements_)
    {
        juce::DynamicObject::Ptr obj = new juce::DynamicObject();
        obj->setProperty("channel", arrangement.channel);
        obj->setProperty("position", static_cast<juce::int64>(arrangement.position.totalUnits()));
        obj->setProperty("name", juce::String(arrangement.pattern.getName()));

        const auto& ts = arrangement.pattern.getTimeSignature();
        obj->setProperty("timeSignatureTop", ts.top);
        obj->setProperty("timeSignatureBottom", ts.bottom);

        juce::Array<juce::var> notes;
        for (const auto& note : arrangement.pattern.getNotes())
        {
            juce::DynamicObject::Ptr noteObj = new juce::DynamicObject();
            noteObj->setProperty("key", note.key);
            noteObj->setProperty("velocity", note.velocity);
            noteObj->setProperty("start", static_cast<juce::int64>(note.start.totalUnits()));
            noteObj->setProperty("duration", static_cast<juce::int64>(note.duration.totalUnits()));
            notes.add(juce::var(noteObj.get()));
        }
        obj->setProperty("notes", notes);
        arrangements.add(juce::var(obj.get()));
    }

    juce::DynamicObject::Ptr root = new juce::DynamicObject();
    root->setProperty("arrangements", arrangements);
    return juce::var(root.get());
}

void PatternSequencer::setState(const juce::var& state)
{
    arrangements_.clear();

    if (auto* list = state["arrangements"].getArray())
    {
        for (const auto& arrangementVar : *list)
        {
            model::Pattern pattern(arrangementVar["name"].toString().toStdString());
            pattern.setTimeSignature(model::TimeSignature(
                static_cast<int>(arrangementVar.getProperty("timeSignatureTop", 4)),
                static_cast<int>(arrangementVar.getProperty("timeSignatureBottom", 4))));

            if (auto* notes = arrangementVar["notes"].getArray())
            {
                for (const auto& noteVar : *notes)
                {
                    model::Note note;
                    note.key = static_cast<int>(noteVar.getProperty("key", 60));
                    note.velocity = static_cast<float>(noteVar.getProperty("velocity", 1.0));
                    note.start = model::MusicalTime::fromUnits(
                        static_cast<uint64_t>(static_cast<juce::int64>(noteVar["start"])));
                    note.duration = model::MusicalTime::fromUnits(
                        static_cast<uint64_t>(static_cast<juce::int64>(noteVar["duration"])));
                    pattern.addNote(note);
                }
            }

            Arrangement arrangement;
            arrangement.channel = juce::jlimit(0, model::MIDI_CHANNEL_COUNT - 1,
                                               static_cast<int>(arrangementVar["channel"]));
            arrangement.position = model::MusicalTime::fromUnits(
                static_cast<uint64_t>(static_cast<juce::int64>(arrangementVar["position"])));
            arrangement.pattern = std::move(pattern);
            arrangements_.push_back(std::move(arrangement));
        }
    }

    rebuildEvents();
}

} // namespace audio
