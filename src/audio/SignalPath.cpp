#include "SignalPath.h"
#include <algorithm>

namespace audio {

namespace {

float toBipolar(float value)
{
    return juce::jlimit(-1.0f, 1.0f, value);
}

} // namespace

SignalPath::SignalPath(std::vector<Point> points) : points_(std::move(points))
{
    for (auto& p : points_)
        p.value = toBipolar(p.value);
    rebuildSteps();
}

int SignalPath::addPoint(model::MusicalTime when)
{
    const float value = calculateValue(when).value_or(0.0f);

    auto it = std::find_if(points_.begin(), points_.end(),
                           [when](const Point& p) { return p.when >= when; });
    auto index = static_cast<int>(it - points_.begin());
    points_.insert(it, Point(when, value));
    rebuildSteps();
    return index;
}

bool SignalPath::removePoint(int index)
{
    if (index < 0 || index >= static_cast<int>(points_.size()))
        return false;

    points_.erase(points_.begin() + index);
    rebuildSteps();
    return true;
}

bool SignalPath::setPointValue(int index, float value)
{
    if (index < 0 || index >= static_cast<int>(points_.size()))
        return false;

    points_[static_cast<size_t>(index)].value = toBipolar(value);
    rebuildSteps();
    return true;
}

std::optional<float> SignalPath::calculateValue(model::MusicalTime when) const
{
    if (steps_.empty())
        return std::nullopt;

    // Last step starting at or before when
    auto it = std::upper_bound(steps_.begin(), steps_.end(), when,
                               [](const model::MusicalTime& t, const Step& s) { return t < s.range.start; });
    if (it == steps_.begin())
        return steps_.front().startValue;
    --it;

    const auto& step = *it;
    if (when >= step.range.end)
        return step.endValue;

    const auto duration = static_cast<double>(step.range.length().totalUnits());
    const auto elapsed = static_cast<double>((when - step.range.start).totalUnits());
    const double fraction = duration > 0.0 ? elapsed / duration : 0.0;
    return step.startValue + (step.endValue - step.startValue) * static_cast<float>(fraction);
}

void SignalPath::work(const model::WorkEventFn& eventFn)
{
    auto value = calculateValue(timeRange_.start);
    if (!value.has_value())
        return;

    if (lastBroadcastValue_.has_value() && *lastBroadcastValue_ == *value)
        return;

    lastBroadcastValue_ = value;
    eventFn(model::WorkEvent::control((*value + 1.0f) * 0.5f));
}

void SignalPath::rebuildSteps()
{
    steps_.clear();

    model::MusicalTime lastWhen;
    std::optional<float> lastValue;

    for (const auto& point : points_)
    {
        // Equal times would make a zero-length step
        if (point.when > lastWhen)
        {
            Step step;
            step.range = model::TimeRange(lastWhen, point.when);
            step.startValue = lastValue.value_or(point.value);
            step.endValue = point.value;
            steps_.push_back(step);
        }
        lastWhen = point.when;
        lastValue = point.value;
    }

    if (lastValue.has_value())
    {
        Step trailing;
        trailing.range = model::TimeRange(lastWhen, model::MusicalTime::max());
        trailing.startValue = *lastValue;
        trailing.endValue = *lastValue;
        steps_.push_back(trailing);
    }
}

SignalPathBuilder& SignalPathBuilder::point(model::MusicalTime when, float value)
{
    points_.emplace_back(when, value);
    return *this;
}

SignalPath SignalPathBuilder::build() const
{
    auto points = points_;
    std::stable_sort(points.begin(), points.end(),
                     [](const SignalPath::Point& a, const SignalPath::Point& b) { return a.when < b.when; });
    return SignalPath(std::move(points));
}

} // namespace audio
