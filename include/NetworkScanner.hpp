#pragma once
#include <string>
#include <vector>
#include "EntityAccessor.hpp"
#include "StageResult.hpp"
#include "Types.hpp"

// Whole-network scans. Expensive; results are cached by CacheManager.
class NetworkScanner
{
public:
    static inline const Bounds WORLD_BOUNDS = {-1.0e7, -1.0e7, 1.0e7, 1.0e7};

    static inline const std::vector<std::string> EDGE_COMPONENTS = {"BASE_EDGE", "TRACK_EDGE", "STREET_EDGE"};
    static inline const std::vector<std::string> GEOMETRY_FIELDS = {"geometry", "geo", "geom"};
    static inline const std::vector<std::string> POINT_LIST_FIELDS = {"coords", "points", "vertices", "samples", "middle", "positions"};
    static inline const std::vector<std::string> SIGNAL_STATE_FIELDS = {"state", "signalState", "mainState", "aspect", "value"};

    static StageResult<std::vector<TrackEdge>> scanTracks(EntityAccessor& accessor);
    static StageResult<std::vector<Signal>> scanSignals(EntityAccessor& accessor);

    static Polyline edgePoints(EntityAccessor& accessor, EntityId edgeId);
    static EdgeKind edgeKind(EntityAccessor& accessor, EntityId edgeId);
    static SignalState normaliseSignalState(Value const* state);

    static char const* edgeKindName(EdgeKind kind) noexcept;
};
