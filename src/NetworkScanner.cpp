#include "NetworkScanner.hpp"

#include "Geometry.hpp"
#include "RecordFields.hpp"

char const* NetworkScanner::edgeKindName(EdgeKind kind) noexcept
{
    switch (kind)
    {
        case EdgeKind::Rail:  return "rail";
        case EdgeKind::Tram:  return "tram";
        case EdgeKind::Other: return "other";
    }
    return "other";
}

static Polyline rounded(Polyline pts)
{
    for (auto& p : pts)
    {
        p.x = RecordFields::round(p.x, 2);
        p.y = RecordFields::round(p.y, 2);
    }
    return pts;
}

static std::optional<Vec2> tangent(Value const& comp, char const* key)
{
    Value const* t = comp.field(key);
    if (!t)
        return std::nullopt;

    Value const* x = t->field("x");
    if (!x) x = t->index(1);
    Value const* y = t->field("y");
    if (!y) y = t->index(2);
    if (!x || !y || !x->isNumber() || !y->isNumber())
        return std::nullopt;
    return Vec2{*x->asNumber(), *y->asNumber()};
}

Polyline NetworkScanner::edgePoints(EntityAccessor& accessor, EntityId edgeId)
{
    std::optional<Value> comp;
    for (auto const& type : EDGE_COMPONENTS)
    {
        comp = accessor.getComponent(edgeId, type);
        if (comp)
            break;
    }
    if (!comp)
        return {};

    if (Value const* geom = RecordFields::first(*comp, GEOMETRY_FIELDS))
    {
        Value const* coords = RecordFields::first(*geom, POINT_LIST_FIELDS);
        Value const* params = geom->field("params");
        if (!coords && params)
            coords = params->field("pos");

        if (coords)
        {
            Polyline pts;
            for (Value const* p : coords->elements())
            {
                if (auto np = RecordFields::point(*p))
                    pts.push_back(*np);
            }
            return pts;
        }

        if (auto curve = Geometry::decode(params ? *params : *geom))
            return rounded(Geometry::sample(*curve));
    }

    EntityId node0 = RecordFields::toEntityId(comp->field("node0"));
    EntityId node1 = RecordFields::toEntityId(comp->field("node1"));
    if (node0 == 0 || node1 == 0)
        return {};

    std::optional<Value> n0 = accessor.getComponent(node0, "BASE_NODE");
    std::optional<Value> n1 = accessor.getComponent(node1, "BASE_NODE");
    if (!n0 || !n1)
        return {};

    std::optional<Vec3> p0 = RecordFields::position(*n0);
    std::optional<Vec3> p1 = RecordFields::position(*n1);
    if (!p0 || !p1)
        return {};

    Vec2 a{p0->x, p0->y};
    Vec2 b{p1->x, p1->y};
    auto t0 = tangent(*comp, "tangent0");
    auto t1 = tangent(*comp, "tangent1");

    CurveParams curve = (t0 && t1) ? CurveParams(HermiteCurve{a, b, *t0, *t1})
                                   : CurveParams(StraightCurve{a, b});
    return rounded(Geometry::sample(curve));
}

EdgeKind NetworkScanner::edgeKind(EntityAccessor& accessor, EntityId edgeId)
{
    if (accessor.getComponent(edgeId, "TRACK_EDGE"))
        return EdgeKind::Rail;

    if (std::optional<Value> street = accessor.getComponent(edgeId, "STREET_EDGE"))
    {
        if (RecordFields::toInt(street->field("tramTrackType")) > 0)
            return EdgeKind::Tram;
    }
    return EdgeKind::Other;
}

StageResult<std::vector<TrackEdge>> NetworkScanner::scanTracks(EntityAccessor& accessor)
{
    if (!accessor.provides(HostCall::GetComponent))
        return stageError("tracks", "host does not provide getComponent");

    std::vector<EntityId> ids = accessor.enumerate(EntityKind::Edge);
    if (ids.empty())
        ids = accessor.enumerateRegion(WORLD_BOUNDS, EntityKind::Edge);
    if (ids.empty())
        return stageError("tracks", "no edges enumerated");

    std::vector<TrackEdge> edges;
    edges.reserve(ids.size());
    for (EntityId id : ids)
    {
        Polyline pts = edgePoints(accessor, id);
        if (pts.size() < 2)
            continue;

        TrackEdge edge;
        edge.id = id;
        edge.kind = edgeKind(accessor, id);
        edge.points = std::move(pts);
        edges.push_back(std::move(edge));
    }

    if (edges.empty())
        return stageError("tracks", "no edge geometry readable");
    return edges;
}

SignalState NetworkScanner::normaliseSignalState(Value const* state)
{
    if (!state)
        return SignalState::Unknown;

    if (state->isBool())
        return state->truthy() ? SignalState::Proceed : SignalState::Stop;

    if (auto n = state->asNumber())
        return *n > 0.0 ? SignalState::Proceed : SignalState::Stop;

    return SignalState::Unknown;
}

StageResult<std::vector<Signal>> NetworkScanner::scanSignals(EntityAccessor& accessor)
{
    if (!accessor.provides(HostCall::GetEntityList) && !accessor.provides(HostCall::GetEntitiesInRegion))
        return stageError("signals", "host cannot enumerate signals");

    std::vector<EntityId> ids = accessor.enumerate(EntityKind::Signal);
    if (ids.empty())
        ids = accessor.enumerateRegion(WORLD_BOUNDS, EntityKind::Signal);
    // A failed enumeration also comes back empty; keep the cached signals.
    if (ids.empty())
        return stageError("signals", "no signals enumerated");

    std::vector<Signal> signals;
    signals.reserve(ids.size());
    for (EntityId sid : ids)
    {
        Signal s;
        s.id = sid;

        if (std::optional<Value> ent = accessor.getEntity(sid))
        {
            if (auto pos = RecordFields::position(*ent))
                s.pos = *pos;
        }

        if (std::optional<Value> comp = accessor.getComponent(sid, "SIGNAL"))
        {
            // false is a real aspect here, so no truthiness filter.
            Value const* state = nullptr;
            for (auto const& field : SIGNAL_STATE_FIELDS)
            {
                state = comp->field(field);
                if (state)
                    break;
            }
            s.state = normaliseSignalState(state);
        }
        signals.push_back(s);
    }
    return signals;
}
