#pragma once

#include "SignalPath.h"
#include "../model/Entity.h"
#include "../model/EntityRepository.h"
#include "../model/Uid.h"
#include <functional>
#include <map>
#include <variant>
#include <vector>

namespace audio {

// An edge from a control source to one parameter of a target entity
struct ControlLink
{
    model::Uid target;
    model::ControlIndex param = 0;

    bool operator==(const ControlLink& o) const { return target == o.target && param == o.param; }
};

// Either an entity (e.g. an LFO) or a signal path drives a link
using ControlLinkSource = std::variant<model::Uid, model::PathUid>;

// Routes control values from their sources to linked entity parameters
class Automator
{
public:
    using NotFoundFn = std::function<void(model::Uid target)>;
    using ProxyEventFn = std::function<void(model::PathUid source, const model::WorkEvent& event)>;

    Automator();

    // Duplicates are allowed: each link is one automation lane
    void link(model::Uid source, model::Uid target, model::ControlIndex param);
    void unlink(model::Uid source, model::Uid target, model::ControlIndex param);
    const std::vector<ControlLink>& getLinks(model::Uid source) const;

    // Delivers value to every target linked to source. A target that no
    // longer exists is reported through notFound and skipped.
    void route(model::EntityRepository& entities, const NotFoundFn& notFound,
               const ControlLinkSource& source, model::ControlValue value) const;

    // Signal paths
    model::PathUid addPath(SignalPath path);
    // Restores a path under a uid minted elsewhere
    juce::Result insertPath(model::PathUid uid, SignalPath path);
    juce::Result removePath(model::PathUid uid);
    SignalPath* getPath(model::PathUid uid);
    const std::map<model::PathUid, SignalPath>& getPaths() const { return paths_; }

    juce::Result linkPath(model::PathUid path, model::Uid target, model::ControlIndex param);
    void unlinkPath(model::PathUid path, model::Uid target, model::ControlIndex param);
    bool isPathLinked(model::PathUid path, model::Uid target, model::ControlIndex param) const;
    const std::vector<ControlLink>& getPathLinks(model::PathUid path) const;

    const std::map<model::Uid, std::vector<ControlLink>>& getAllLinks() const { return controllables_; }
    const std::map<model::PathUid, std::vector<ControlLink>>& getAllPathLinks() const { return pathLinks_; }

    // Signal path lifecycle
    void updateTimeRange(const model::TimeRange& range);
    void workAsProxy(const ProxyEventFn& fn);
    void reset();
    void afterDeser();

    void clear();

private:
    std::map<model::Uid, std::vector<ControlLink>> controllables_;
    model::UidFactory<model::PathUid> pathUidFactory_;
    std::map<model::PathUid, SignalPath> paths_;
    std::map<model::PathUid, std::vector<ControlLink>> pathLinks_;
};

} // namespace audio
