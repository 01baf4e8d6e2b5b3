#include "PathBuilder.hpp"

#include "NetworkScanner.hpp"
#include "RecordFields.hpp"

Polyline PathBuilder::edgeRoute(EntityId lineId, EntityAccessor& accessor)
{
    std::optional<Value> record = accessor.getComponent(lineId, "LINE");
    if (!record)
        record = accessor.getEntity(lineId);
    if (!record)
        return {};

    Polyline points;
    for (auto const& key : LINE_EDGE_FIELDS)
    {
        Value const* list = record->field(key);
        if (!list)
            continue;

        for (EntityId edgeId : RecordFields::idList(*list))
        {
            Polyline pts = NetworkScanner::edgePoints(accessor, edgeId);
            points.insert(points.end(), pts.begin(), pts.end());
        }
        if (!points.empty())
            break;
    }
    return points;
}

Polyline PathBuilder::stopRoute(Line const& line, StationResolver const& stations, EntityAccessor& accessor)
{
    Polyline points;
    for (auto const& stop : line.stops)
    {
        if (Station const* st = stations.find(stop.stationId))
        {
            points.push_back({st->pos.x, st->pos.y});
            continue;
        }
        if (stop.rawStopId == 0)
            continue;

        if (std::optional<Value> ent = accessor.getEntity(stop.rawStopId))
        {
            if (auto pos = RecordFields::position(*ent))
                points.push_back({pos->x, pos->y});
        }
    }
    return points;
}

std::vector<Path> PathBuilder::build(std::vector<Line> const& lines, StationResolver const& stations, EntityAccessor& accessor)
{
    std::vector<Path> paths;
    for (auto const& line : lines)
    {
        Polyline pts = edgeRoute(line.id, accessor);
        if (pts.empty())
            pts = stopRoute(line, stations, accessor);
        if (pts.empty())
            continue;

        paths.push_back(Path{line.id, std::move(pts)});
    }
    return paths;
}
