#include "Pattern.h"
#include <algorithm>

namespace model {

Pattern::Pattern() : Pattern("Untitled") {}

Pattern::Pattern(const std::string& name) : name_(name) {}

Pattern Pattern::fromNoteSequence(const std::vector<int>& keys, MusicalTime stepDuration, const std::string& name)
{
    Pattern pattern(name);
    MusicalTime position;
    for (int key : keys)
    {
        if (key != REST)
            pattern.addNote(Note(key, position, stepDuration));
        position += stepDuration;
    }
    return pattern;
}

void Pattern::addNote(const Note& note)
{
    auto it = std::upper_bound(notes_.begin(), notes_.end(), note.start,
                               [](const MusicalTime& t, const Note& n) { return t < n.start; });
    notes_.insert(it, note);
}

bool Pattern::removeNote(int index)
{
    if (index < 0 || index >= getNoteCount())
        return false;
    notes_.erase(notes_.begin() + index);
    return true;
}

MusicalTime Pattern::getDuration() const
{
    MusicalTime lastEnd;
    for (const auto& note : notes_)
        lastEnd = std::max(lastEnd, note.end());

    if (lastEnd == MusicalTime())
        return MusicalTime::fromBars(timeSignature_, 1);
    return lastEnd.quantizedToBar(timeSignature_);
}

} // namespace model
