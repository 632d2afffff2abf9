#pragma once

#include <juce_core/juce_core.h>
#include <atomic>
#include <cstdint>

namespace model {

// Opaque identifier. The tag keeps entity, track and path ids from mixing.
template <typename Tag>
struct Id
{
    uint64_t value = 0;

    constexpr Id() = default;
    constexpr explicit Id(uint64_t v) : value(v) {}

    bool isValid() const { return value != 0; }

    bool operator==(const Id& o) const { return value == o.value; }
    bool operator!=(const Id& o) const { return value != o.value; }
    bool operator<(const Id& o) const { return value < o.value; }

    juce::String toString() const { return juce::String(static_cast<juce::int64>(value)); }
};

struct EntityIdTag {};
struct TrackIdTag {};
struct PathIdTag {};

using Uid = Id<EntityIdTag>;
using TrackUid = Id<TrackIdTag>;
using PathUid = Id<PathIdTag>;

// Mints ids monotonically. Ids minted elsewhere (e.g. loaded from disk) are
// reported through notifyExternallyMintedUid so they are never minted again.
template <typename IdType>
class UidFactory
{
public:
    static constexpr uint64_t FIRST_ENTITY_UID = 1;
    static constexpr uint64_t FIRST_PATH_UID = 1024;

    explicit UidFactory(uint64_t firstValue = FIRST_ENTITY_UID) : next_(firstValue) {}

    IdType mintNext() { return IdType(next_.fetch_add(1, std::memory_order_relaxed)); }

    void notifyExternallyMintedUid(IdType uid)
    {
        auto current = next_.load(std::memory_order_relaxed);
        while (uid.value >= current
               && !next_.compare_exchange_weak(current, uid.value + 1, std::memory_order_relaxed))
        {
        }
    }

    uint64_t peekNext() const { return next_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> next_;
};

} // namespace model
