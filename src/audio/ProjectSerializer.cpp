#include "ProjectSerializer.h"

namespace audio {

static juce::var idToVar(uint64_t value)
{
    return juce::var(static_cast<juce::int64>(value));
}

static uint64_t varToId(const juce::var& v)
{
    return static_cast<uint64_t>(static_cast<juce::int64>(v));
}

static juce::var timeToVar(const model::MusicalTime& time)
{
    return juce::var(static_cast<juce::int64>(time.totalUnits()));
}

static model::MusicalTime varToTime(const juce::var& v)
{
    return model::MusicalTime::fromUnits(static_cast<uint64_t>(static_cast<juce::int64>(v)));
}

static juce::var linkToVar(const ControlLink& link)
{
    juce::DynamicObject::Ptr obj = new juce::DynamicObject();
    obj->setProperty("target", idToVar(link.target.value));
    obj->setProperty("param", link.param);
    return juce::var(obj.get());
}

//==============================================================================

juce::Result ProjectSerializer::save(Orchestrator& orchestrator, const juce::File& file)
{
    if (!file.replaceWithText(toJson(orchestrator)))
        return juce::Result::fail("Could not write " + file.getFullPathName());
    return juce::Result::ok();
}

juce::Result ProjectSerializer::load(Orchestrator& orchestrator, const EntityFactory& factory,
                                     const juce::File& file)
{
    if (!file.existsAsFile())
        return juce::Result::fail("File not found: " + file.getFullPathName());

    return fromJson(orchestrator, factory, file.loadFileAsString());
}

juce::String ProjectSerializer::toJson(Orchestrator& orchestrator)
{
    return juce::JSON::toString(toVar(orchestrator));
}

juce::Result ProjectSerializer::fromJson(Orchestrator& orchestrator, const EntityFactory& factory,
                                         const juce::String& json)
{
    juce::var root;
    auto parsed = juce::JSON::parse(json, root);
    if (parsed.failed())
    {
        DBG("Project parse error: " << parsed.getErrorMessage());
        return parsed;
    }
    return fromVar(orchestrator, factory, root);
}

juce::var ProjectSerializer::toVar(Orchestrator& orchestrator)
{
    orchestrator.beforeSer();

    juce::DynamicObject::Ptr root = new juce::DynamicObject();
    root->setProperty("version", VERSION);
    root->setProperty("tempo", orchestrator.getTempo().bpm);

    const auto ts = orchestrator.getTimeSignature();
    root->setProperty("timeSignatureTop", ts.top);
    root->setProperty("timeSignatureBottom", ts.bottom);

    const auto& mixer = orchestrator.getMixer();
    const auto& entities = orchestrator.getEntityRepository();

    // Tracks, in order, with their entity chains
    juce::Array<juce::var> tracks;
    for (auto track : orchestrator.getTrackUids())
    {
        juce::DynamicObject::Ptr t = new juce::DynamicObject();
        t->setProperty("uid", idToVar(track.value));
        t->setProperty("aux", orchestrator.isAuxTrack(track));
        t->setProperty("output", mixer.getTrackOutput(track));
        t->setProperty("muted", mixer.isTrackMuted(track));

        juce::Array<juce::var> chain;
        for (auto uid : orchestrator.getEntitiesForTrack(track))
        {
            if (const auto* entity = entities.getEntity(uid))
                chain.add(entityToVar(orchestrator, *entity));
        }
        t->setProperty("entities", chain);
        tracks.add(juce::var(t.get()));
    }
    root->setProperty("tracks", tracks);

    if (auto solo = mixer.getSoloTrack())
        root->setProperty("solo", idToVar(solo->value));

    // Bus sends
    juce::Array<juce::var> sends;
    for (const auto& [source, routes] : orchestrator.getBusStation().getSends())
    {
        for (const auto& route : routes)
        {
            juce::DynamicObject::Ptr s = new juce::DynamicObject();
            s->setProperty("source", idToVar(source.value));
            s->setProperty("aux", idToVar(route.auxTrack.value));
            s->setProperty("amount", route.amount);
            sends.add(juce::var(s.get()));
        }
    }
    root->setProperty("sends", sends);

    // Automation
    const auto& automator = orchestrator.getAutomator();
    juce::Array<juce::var> links;
    for (const auto& [source, sourceLinks] : automator.getAllLinks())
    {
        if (!entities.contains(source))
            continue;

        for (const auto& link : sourceLinks)
        {
            // Links to deleted entities are kept while editing but not saved
            if (!entities.contains(link.target))
                continue;

            auto v = linkToVar(link);
            v.getDynamicObject()->setProperty("source", idToVar(source.value));
            links.add(v);
        }
    }
    root->setProperty("links", links);

    juce::Array<juce::var> paths;
    for (const auto& [uid, path] : automator.getPaths())
        paths.add(signalPathToVar(uid, path, automator, entities));
    root->setProperty("paths", paths);

    return juce::var(root.get());
}

juce::var ProjectSerializer::entityToVar(const Orchestrator& orchestrator, const model::Entity& entity)
{
    juce::DynamicObject::Ptr obj = new juce::DynamicObject();
    obj->setProperty("uid", idToVar(entity.getUid().value));
    obj->setProperty("type", juce::String(entity.getTypeName()));

    juce::Array<juce::var> params;
    for (int i = 0; i < entity.getNumParameters(); ++i)
        params.add(entity.getParameter(i));
    obj->setProperty("params", params);

    const auto state = entity.getState();
    if (!state.isVoid())
        obj->setProperty("state", state);

    const auto& humidities = orchestrator.getHumidifier().getHumidities();
    auto humidity = humidities.find(entity.getUid());
    if (humidity != humidities.end())
        obj->setProperty("humidity", humidity->second);

    juce::Array<juce::var> midiChannels;
    for (auto channel : orchestrator.getMidiRouter().getReceiverChannels(entity.getUid()))
        midiChannels.add(channel);
    if (!midiChannels.isEmpty())
        obj->setProperty("midiChannels", midiChannels);

    return juce::var(obj.get());
}

juce::var ProjectSerializer::signalPathToVar(model::PathUid uid, const SignalPath& path, const Automator& automator,
                                             const model::EntityRepository& entities)
{
    juce::DynamicObject::Ptr obj = new juce::DynamicObject();
    obj->setProperty("uid", idToVar(uid.value));

    juce::Array<juce::var> points;
    for (const auto& point : path.getPoints())
    {
        juce::DynamicObject::Ptr p = new juce::DynamicObject();
        p->setProperty("when", timeToVar(point.when));
        p->setProperty("value", point.value);
        points.add(juce::var(p.get()));
    }
    obj->setProperty("points", points);

    juce::Array<juce::var> links;
    for (const auto& link : automator.getPathLinks(uid))
    {
        if (entities.contains(link.target))
            links.add(linkToVar(link));
    }
    obj->setProperty("links", links);

    return juce::var(obj.get());
}

//==============================================================================

juce::Result ProjectSerializer::fromVar(Orchestrator& orchestrator, const EntityFactory& factory,
                                        const juce::var& root)
{
    orchestrator.clear();

    auto result = restore(orchestrator, factory, root);
    if (result.failed())
    {
        DBG("Project load failed: " << result.getErrorMessage());
        orchestrator.clear();
        return result;
    }

    orchestrator.afterDeser();
    return juce::Result::ok();
}

juce::Result ProjectSerializer::restore(Orchestrator& orchestrator, const EntityFactory& factory,
                                        const juce::var& root)
{
    if (!root.isObject())
        return juce::Result::fail("Not a project");

    if (root.hasProperty("tempo"))
        orchestrator.updateTempo(model::Tempo(static_cast<double>(root["tempo"])));

    model::TimeSignature ts(static_cast<int>(root.getProperty("timeSignatureTop", 4)),
                            static_cast<int>(root.getProperty("timeSignatureBottom", 4)));
    auto result = orchestrator.updateTimeSignature(ts);
    if (result.failed())
        return result;

    if (auto* tracks = root["tracks"].getArray())
    {
        for (const auto& t : *tracks)
        {
            const model::TrackUid track(varToId(t["uid"]));
            result = orchestrator.insertTrack(track, static_cast<bool>(t["aux"]));
            if (result.failed())
                return result;

            orchestrator.getMixer().setTrackOutput(track, static_cast<float>(t.getProperty("output", 1.0)));
            orchestrator.getMixer().setTrackMuted(track, static_cast<bool>(t["muted"]));

            if (auto* chain = t["entities"].getArray())
            {
                for (const auto& e : *chain)
                {
                    result = varToEntity(orchestrator, factory, track, e);
                    if (result.failed())
                        return result;
                }
            }
        }
    }

    if (root.hasProperty("solo"))
        orchestrator.getMixer().setSoloTrack(model::TrackUid(varToId(root["solo"])));

    if (auto* sends = root["sends"].getArray())
    {
        for (const auto& s : *sends)
        {
            result = orchestrator.addSend(model::TrackUid(varToId(s["source"])),
                                          model::TrackUid(varToId(s["aux"])),
                                          static_cast<float>(s["amount"]));
            if (result.failed())
                return result;
        }
    }

    if (auto* links = root["links"].getArray())
    {
        for (const auto& l : *links)
        {
            const model::Uid source(varToId(l["source"]));
            const model::Uid target(varToId(l["target"]));
            result = orchestrator.link(source, target, static_cast<int>(l["param"]));
            if (result.failed())
                DBG("Skipping control link " << source.toString() << " -> " << target.toString()
                                             << ": " << result.getErrorMessage());
        }
    }

    if (auto* paths = root["paths"].getArray())
    {
        for (const auto& p : *paths)
        {
            result = varToSignalPath(orchestrator, p);
            if (result.failed())
                return result;
        }
    }

    return juce::Result::ok();
}

juce::Result ProjectSerializer::varToEntity(Orchestrator& orchestrator, const EntityFactory& factory,
                                            model::TrackUid track, const juce::var& v)
{
    const auto type = v["type"].toString();
    auto entity = factory.create(type.toStdString());
    if (entity == nullptr)
        return juce::Result::fail("Unknown entity type");

    const model::Uid uid(varToId(v["uid"]));
    entity->setUid(uid);

    // State first: it may change how many parameters there are
    if (v.hasProperty("state"))
        entity->setState(v["state"]);

    if (auto* params = v["params"].getArray())
    {
        for (int i = 0; i < params->size() && i < entity->getNumParameters(); ++i)
            entity->setParameter(i, static_cast<float>((*params)[i]));
    }

    auto result = orchestrator.addEntity(track, std::move(entity));
    if (result.failed())
        return result;

    if (v.hasProperty("humidity"))
        orchestrator.getHumidifier().setHumidity(uid, static_cast<float>(v["humidity"]));

    if (auto* midiChannels = v["midiChannels"].getArray())
    {
        for (const auto& channel : *midiChannels)
        {
            result = orchestrator.setMidiReceiverChannel(uid, static_cast<int>(channel));
            if (result.failed())
                return result;
        }
    }

    return juce::Result::ok();
}

juce::Result ProjectSerializer::varToSignalPath(Orchestrator& orchestrator, const juce::var& v)
{
    std::vector<SignalPath::Point> points;
    if (auto* list = v["points"].getArray())
    {
        for (const auto& p : *list)
            points.emplace_back(varToTime(p["when"]), static_cast<float>(p["value"]));
    }

    // Saved paths are already ordered, but hand-edited files may not be
    SignalPathBuilder builder;
    for (const auto& point : points)
        builder.point(point.when, point.value);

    auto& automator = orchestrator.getAutomator();
    const model::PathUid uid(varToId(v["uid"]));
    auto result = automator.insertPath(uid, builder.build());
    if (result.failed())
        return result;

    if (auto* links = v["links"].getArray())
    {
        for (const auto& l : *links)
        {
            const model::Uid target(varToId(l["target"]));
            if (!orchestrator.getEntityRepository().contains(target))
            {
                DBG("Skipping link from path " << uid.toString() << ": entity " << target.toString()
                                               << " not found");
                continue;
            }

            result = automator.linkPath(uid, target, static_cast<int>(l["param"]));
            if (result.failed())
                return result;
        }
    }
    return juce::Result::ok();
}

} // namespace audio
