#pragma once

#include "../model/Entity.h"
#include "../model/Time.h"
#include <optional>
#include <vector>

namespace audio {

// Piecewise-linear automation curve. Values are bipolar (-1..1) and hold
// level before the first point and after the last.
class SignalPath
{
public:
    struct Point
    {
        model::MusicalTime when;
        float value = 0.0f;

        Point() = default;
        Point(model::MusicalTime w, float v) : when(w), value(v) {}
    };

    // One linear segment of the curve over [range.start, range.end)
    struct Step
    {
        model::TimeRange range;
        float startValue = 0.0f;
        float endValue = 0.0f;
    };

    SignalPath() = default;
    // points must already be ordered by time
    explicit SignalPath(std::vector<Point> points);

    // Inserts a point carrying the curve's current value at when (0 if the
    // path is empty). Returns the new point's index.
    int addPoint(model::MusicalTime when);
    bool removePoint(int index);
    bool setPointValue(int index, float value);

    const std::vector<Point>& getPoints() const { return points_; }
    const std::vector<Step>& getSteps() const { return steps_; }

    std::optional<float> calculateValue(model::MusicalTime when) const;

    // Controller lifecycle
    void updateTimeRange(const model::TimeRange& range) { timeRange_ = range; }
    // Emits a control value only when it differs from the last one sent
    void work(const model::WorkEventFn& eventFn);
    void reset() { lastBroadcastValue_.reset(); }

    void afterDeser() { rebuildSteps(); }

private:
    void rebuildSteps();

    std::vector<Point> points_;
    std::vector<Step> steps_;
    model::TimeRange timeRange_;
    std::optional<float> lastBroadcastValue_;
};

class SignalPathBuilder
{
public:
    SignalPathBuilder& point(model::MusicalTime when, float value);

    // Points may be given in any order; they are sorted by time (stable)
    SignalPath build() const;

private:
    std::vector<SignalPath::Point> points_;
};

} // namespace audio
