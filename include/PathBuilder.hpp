#pragma once
#include <string>
#include <vector>
#include "EntityAccessor.hpp"
#include "StationResolver.hpp"
#include "Types.hpp"

// Coarse per-line polylines. Uses the line's own edge list when the host
// exposes one, otherwise joins the positions of its stops.
class PathBuilder
{
public:
    static inline const std::vector<std::string> LINE_EDGE_FIELDS = {"edgeList", "edges", "edgeIds", "segments"};

    static std::vector<Path> build(std::vector<Line> const& lines, StationResolver const& stations, EntityAccessor& accessor);

    static Polyline edgeRoute(EntityId lineId, EntityAccessor& accessor);
    static Polyline stopRoute(Line const& line, StationResolver const& stations, EntityAccessor& accessor);
};
