#include "LineResolver.hpp"

#include "RecordFields.hpp"

std::vector<Line> LineResolver::resolveLines(EntityAccessor& accessor, StationResolver& stations)
{
    std::vector<Line> lines;

    for (EntityId lid : accessor.enumerate(EntityKind::Line))
    {
        std::optional<Value> record = accessor.getEntity(lid);
        if (!record)
            record = accessor.getComponent(lid, "LINE");

        lines.push_back(resolveLine(lid, record ? &*record : nullptr, stations, accessor));
    }
    return lines;
}

Line LineResolver::resolveLine(EntityId lineId, Value const* record, StationResolver& stations, EntityAccessor& accessor)
{
    Line line;
    line.id = lineId;

    std::optional<std::string> name;
    if (record)
    {
        name = RecordFields::explicitName(*record, {"name"});

        std::string type = RecordFields::toStr(RecordFields::first(*record, VEHICLE_TYPE_FIELDS));
        if (!type.empty())
            line.vehicleType = type;

        if (Value const* rawStops = RecordFields::first(*record, STOP_LIST_FIELDS))
        {
            int index = 0;
            for (Value const* stop : rawStops->elements())
            {
                auto [stationId, rawId] = extractStationIdFromStop(*stop, stations);

                Stop resolved;
                resolved.index     = ++index;
                resolved.stationId = stationId;
                resolved.rawStopId = rawId;
                resolved.name      = resolveStopDisplayName(stationId, rawId, *stop, stations, accessor);
                line.stops.push_back(std::move(resolved));
            }
        }
    }

    line.name = name ? *name : "Line #" + std::to_string(lineId);
    return line;
}

std::pair<EntityId, EntityId> LineResolver::extractStationIdFromStop(Value const& stop, StationResolver& stations)
{
    if (stop.isNumber())
    {
        EntityId n = RecordFields::toInt(&stop);
        return {stations.resolveToStationId(n), n};
    }

    if (!stop.isTable())
        return {0, 0};

    EntityId rawId = RecordFields::toEntityId(RecordFields::first(stop, STOP_ID_FIELDS));

    if (auto sid = stations.tryResolve(rawId))
        return {*sid, rawId};

    if (auto deep = stations.findStationIdDeep(stop))
        return {*deep, rawId};

    return {rawId, rawId};
}

std::string LineResolver::resolveStopDisplayName(EntityId stationId, EntityId rawId, Value const& stop,
                                                 StationResolver& stations, EntityAccessor& accessor)
{
    if (stop.isTable())
    {
        if (auto direct = RecordFields::explicitName(stop, STOP_NAME_FIELDS))
            return *direct;
    }

    Station const* cached = stations.find(stationId);
    if (cached && !RecordFields::isPlaceholderName(cached->name))
        return cached->name;

    for (EntityId id : {stationId, rawId})
    {
        if (id == 0)
            continue;
        if (std::optional<Value> ent = accessor.getEntity(id))
        {
            if (auto deep = stations.resolveName(*ent, id))
                return *deep;
        }
        if (rawId == stationId)
            break;
    }

    if (cached)
        return cached->name;

    EntityId labelId = stationId != 0 ? stationId : rawId;
    return "Stop #" + std::to_string(labelId);
}

bool LineResolver::isRoadOrTram(std::string const& vehicleType)
{
    return vehicleType == "ROAD" || vehicleType == "TRAM" || vehicleType == "BUS";
}
