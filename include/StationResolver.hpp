#pragma once
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "EntityAccessor.hpp"
#include "Types.hpp"

// Canonical stations of one snapshot cycle plus the aliases (terminals,
// station groups) that point at them. Rebuilt from scratch by build().
class StationResolver
{
private:
    EntityAccessor& accessor;
    std::map<EntityId, Station> stationCache;
    std::unordered_map<EntityId, EntityId> terminalToStation;
    std::unordered_map<EntityId, EntityId> groupToStation;

    void addStation(EntityId id, Value const& record);
    void addGroup(EntityId id, Value const& record);
    std::optional<EntityId> lookupAlias(EntityId id) const;

public:
    static constexpr int NAME_SEARCH_DEPTH = 4;
    static constexpr int ID_SEARCH_DEPTH = 5;

    static inline const std::vector<std::string> SUB_ENTITY_FIELDS = {"terminals", "components", "platforms", "nodes", "stops", "tracks"};
    static inline const std::vector<std::string> GROUP_MEMBER_FIELDS = {"stations"};
    static inline const std::vector<std::string> REFERENCE_FIELDS = {"station", "stationGroup", "stationEntity", "owner", "parent", "group"};
    static inline const std::vector<std::string> NAME_FIELDS = {"name", "stationName", "terminalName"};
    static inline const std::vector<std::string> DEEP_ID_FIELDS = {
        "stationEntity", "stationEntityId", "station", "stationId",
        "station_id", "terminalEntity", "terminalEntityId", "terminal",
        "terminalId", "entity", "entityId", "id"
    };

    explicit StationResolver(EntityAccessor& accessor);

    void build();
    void clear();

    bool isStation(EntityId id) const;
    Station const* find(EntityId id) const;
    std::vector<Station> stations() const;

    // Canonical station for a station, group or terminal id. An id that
    // resolves to nothing is returned unchanged and acts as its own station.
    EntityId resolveToStationId(EntityId id);
    std::optional<EntityId> tryResolve(EntityId id);

    // Searches nested fields of a record for any id that resolves.
    std::optional<EntityId> findStationIdDeep(Value const& record);

    // Explicit name field first, then a bounded search through the record
    // and the entities it references. Placeholder labels never win.
    std::optional<std::string> resolveName(Value const& record, EntityId selfId = 0);

    std::size_t terminalAliasCount() const noexcept { return terminalToStation.size(); }
    std::size_t groupAliasCount() const noexcept { return groupToStation.size(); }
    std::size_t size() const noexcept { return stationCache.size(); }
};
