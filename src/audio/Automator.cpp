#include "Automator.h"
#include <algorithm>

namespace audio {

namespace {

const std::vector<ControlLink> noLinks;

void removeMatching(std::vector<ControlLink>& links, const ControlLink& link)
{
    links.erase(std::remove(links.begin(), links.end(), link), links.end());
}

} // namespace

Automator::Automator() : pathUidFactory_(model::UidFactory<model::PathUid>::FIRST_PATH_UID) {}

void Automator::link(model::Uid source, model::Uid target, model::ControlIndex param)
{
    controllables_[source].push_back({ target, param });
}

void Automator::unlink(model::Uid source, model::Uid target, model::ControlIndex param)
{
    auto it = controllables_.find(source);
    if (it != controllables_.end())
        removeMatching(it->second, { target, param });
}

const std::vector<ControlLink>& Automator::getLinks(model::Uid source) const
{
    auto it = controllables_.find(source);
    return it != controllables_.end() ? it->second : noLinks;
}

void Automator::route(model::EntityRepository& entities, const NotFoundFn& notFound,
                      const ControlLinkSource& source, model::ControlValue value) const
{
    const std::vector<ControlLink>* links = nullptr;
    if (const auto* uid = std::get_if<model::Uid>(&source))
    {
        auto it = controllables_.find(*uid);
        if (it != controllables_.end())
            links = &it->second;
    }
    else if (const auto* pathUid = std::get_if<model::PathUid>(&source))
    {
        auto it = pathLinks_.find(*pathUid);
        if (it != pathLinks_.end())
            links = &it->second;
    }

    if (links == nullptr)
        return;

    for (const auto& link : *links)
    {
        if (auto* entity = entities.getEntity(link.target))
            entity->setParameter(link.param, value);
        else if (notFound)
            notFound(link.target);
    }
}

model::PathUid Automator::addPath(SignalPath path)
{
    auto uid = pathUidFactory_.mintNext();
    paths_.emplace(uid, std::move(path));
    return uid;
}

juce::Result Automator::insertPath(model::PathUid uid, SignalPath path)
{
    if (!uid.isValid() || paths_.find(uid) != paths_.end())
        return juce::Result::fail("Duplicate signal path uid");

    pathUidFactory_.notifyExternallyMintedUid(uid);
    paths_.emplace(uid, std::move(path));
    return juce::Result::ok();
}

juce::Result Automator::removePath(model::PathUid uid)
{
    if (paths_.erase(uid) == 0)
        return juce::Result::fail("Signal path not found");

    pathLinks_.erase(uid);
    return juce::Result::ok();
}

SignalPath* Automator::getPath(model::PathUid uid)
{
    auto it = paths_.find(uid);
    return it != paths_.end() ? &it->second : nullptr;
}

juce::Result Automator::linkPath(model::PathUid path, model::Uid target, model::ControlIndex param)
{
    if (paths_.find(path) == paths_.end())
        return juce::Result::fail("Signal path not found");

    pathLinks_[path].push_back({ target, param });
    return juce::Result::ok();
}

void Automator::unlinkPath(model::PathUid path, model::Uid target, model::ControlIndex param)
{
    auto it = pathLinks_.find(path);
    if (it != pathLinks_.end())
        removeMatching(it->second, { target, param });
}

bool Automator::isPathLinked(model::PathUid path, model::Uid target, model::ControlIndex param) const
{
    const auto& links = getPathLinks(path);
    return std::find(links.begin(), links.end(), ControlLink{ target, param }) != links.end();
}

const std::vector<ControlLink>& Automator::getPathLinks(model::PathUid path) const
{
    auto it = pathLinks_.find(path);
    return it != pathLinks_.end() ? it->second : noLinks;
}

void Automator::updateTimeRange(const model::TimeRange& range)
{
    for (auto& [uid, path] : paths_)
        path.updateTimeRange(range);
}

void Automator::workAsProxy(const ProxyEventFn& fn)
{
    for (auto& [uid, path] : paths_)
    {
        const auto source = uid;
        path.work([&fn, source](const model::WorkEvent& event) { fn(source, event); });
    }
}

void Automator::reset()
{
    for (auto& [uid, path] : paths_)
        path.reset();
}

void Automator::afterDeser()
{
    for (auto& [uid, path] : paths_)
    {
        pathUidFactory_.notifyExternallyMintedUid(uid);
        path.afterDeser();
    }
}

void Automator::clear()
{
    controllables_.clear();
    paths_.clear();
    pathLinks_.clear();
}

} // namespace audio
