#pragma once
#include <string>
#include <utility>
#include <vector>
#include "EntityAccessor.hpp"
#include "StationResolver.hpp"
#include "Types.hpp"

class LineResolver
{
public:
    static inline const std::vector<std::string> STOP_LIST_FIELDS = {"stops", "waypoints"};
    static inline const std::vector<std::string> VEHICLE_TYPE_FIELDS = {"vehicleType", "transportMode"};
    static inline const std::vector<std::string> STOP_ID_FIELDS = {
        "stationEntity", "stationEntityId", "station", "stationId",
        "terminalEntity", "terminalEntityId", "stopEntity", "stopEntityId",
        "stop", "stopId", "entity", "id"
    };
    static inline const std::vector<std::string> STOP_NAME_FIELDS = {"name", "stopName", "stationName", "terminalName", "label"};

    static std::vector<Line> resolveLines(EntityAccessor& accessor, StationResolver& stations);

    static Line resolveLine(EntityId lineId, Value const* record, StationResolver& stations, EntityAccessor& accessor);

    // (canonical station id, raw id the host reported)
    static std::pair<EntityId, EntityId> extractStationIdFromStop(Value const& stop, StationResolver& stations);

    static std::string resolveStopDisplayName(EntityId stationId, EntityId rawId, Value const& stop,
                                              StationResolver& stations, EntityAccessor& accessor);

    static bool isRoadOrTram(std::string const& vehicleType);
};
