#pragma once

#include "Time.h"
#include <string>
#include <vector>

namespace model {

struct Note
{
    int key = 60;
    float velocity = 1.0f;
    MusicalTime start;
    MusicalTime duration;

    Note() = default;
    Note(int k, MusicalTime s, MusicalTime d, float v = 1.0f) : key(k), velocity(v), start(s), duration(d) {}

    MusicalTime end() const { return start + duration; }
    TimeRange range() const { return TimeRange(start, end()); }

    bool operator==(const Note& o) const
    {
        return key == o.key && velocity == o.velocity && start == o.start && duration == o.duration;
    }
};

// A bar-aligned group of notes, positioned relative to its own start
class Pattern
{
public:
    static constexpr int REST = 255;

    Pattern();
    explicit Pattern(const std::string& name);

    // One note per step; REST leaves the step empty
    static Pattern fromNoteSequence(const std::vector<int>& keys, MusicalTime stepDuration,
                                    const std::string& name = "Untitled");

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    const TimeSignature& getTimeSignature() const { return timeSignature_; }
    void setTimeSignature(const TimeSignature& ts) { timeSignature_ = ts; }

    // Notes are kept ordered by start time
    void addNote(const Note& note);
    bool removeNote(int index);
    const std::vector<Note>& getNotes() const { return notes_; }
    int getNoteCount() const { return static_cast<int>(notes_.size()); }

    // Last note end rounded up to a whole bar; one bar when empty
    MusicalTime getDuration() const;

    void clear() { notes_.clear(); }

private:
    std::string name_;
    TimeSignature timeSignature_;
    std::vector<Note> notes_;
};

} // namespace model
