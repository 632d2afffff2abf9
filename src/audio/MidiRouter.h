#pragma once

#include "../model/Entity.h"
#include "../model/EntityRepository.h"
#include "../model/Uid.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <map>
#include <optional>
#include <vector>

namespace audio {

// Delivers MIDI messages to the entities listening on each channel
class MidiRouter
{
public:
    MidiRouter() = default;

    // Adds uid as a receiver on channel, keeping any channels it already
    // listens on. With no channel, removes it from every channel.
    void setMidiReceiverChannel(model::Uid uid, std::optional<model::MidiChannel> channel);
    // The channel most recently assigned
    std::optional<model::MidiChannel> getReceiverChannel(model::Uid uid) const;
    // Every channel uid listens on, in channel order
    std::vector<model::MidiChannel> getReceiverChannels(model::Uid uid) const;
    const std::vector<model::Uid>& getReceiversForChannel(model::MidiChannel channel) const;

    // Sends message to every receiver on channel. Messages the receivers emit
    // in turn are queued and delivered breadth-first. A receiver emitting on
    // the channel it was called on is a loop: that emission is dropped, the
    // rest of the traversal still runs, and the call then fails.
    juce::Result route(model::EntityRepository& entities, model::MidiChannel channel,
                       const juce::MidiMessage& message);

    // CC 123 on all 16 channels
    void allNotesOff(model::EntityRepository& entities);

    // Rebuilds the uid -> channel index from the channel lists
    void afterDeser();

    const std::map<model::MidiChannel, std::vector<model::Uid>>& getAllReceivers() const { return midiReceivers_; }

    void clear();

private:
    std::map<model::MidiChannel, std::vector<model::Uid>> midiReceivers_;
    std::map<model::Uid, model::MidiChannel> uidToChannel_;
};

} // namespace audio
