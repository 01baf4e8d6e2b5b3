#include "StationResolver.hpp"

#include <algorithm>
#include <cctype>
#include "BoundedSearch.hpp"
#include "RecordFields.hpp"

StationResolver::StationResolver(EntityAccessor& a)
    : accessor(a)
{
}

void StationResolver::clear()
{
    stationCache.clear();
    terminalToStation.clear();
    groupToStation.clear();
}

void StationResolver::build()
{
    clear();

    for (EntityId sid : accessor.enumerate(EntityKind::Station))
    {
        std::optional<Value> ent = accessor.getEntity(sid);
        addStation(sid, ent ? *ent : Value());
    }

    for (EntityId gid : accessor.enumerate(EntityKind::StationGroup))
    {
        std::optional<Value> ent = accessor.getEntity(gid);
        if (ent)
            addGroup(gid, *ent);
    }
}

void StationResolver::addStation(EntityId sid, Value const& record)
{
    Station station;
    station.id = sid;

    std::optional<std::string> name;
    if (!record.isNull())
    {
        name = resolveName(record, sid);

        if (auto pos = RecordFields::position(record))
            station.pos = *pos;

        for (auto const& field : SUB_ENTITY_FIELDS)
        {
            Value const* list = record.field(field);
            if (!list)
                continue;
            for (EntityId sub : RecordFields::idList(*list))
            {
                if (sub != sid)
                    terminalToStation[sub] = sid;
            }
        }

        // Some host builds enumerate groups as stations; their members
        // then alias to the group entry.
        if (Value const* members = RecordFields::first(record, GROUP_MEMBER_FIELDS))
        {
            station.isGroup = true;
            for (EntityId member : RecordFields::idList(*members))
            {
                if (member != sid && !terminalToStation.count(member))
                    terminalToStation[member] = sid;
            }
        }
    }

    station.name = name ? *name : "Station #" + std::to_string(sid);
    stationCache[sid] = std::move(station);
}

void StationResolver::addGroup(EntityId gid, Value const& record)
{
    if (isStation(gid))
        return;

    std::vector<EntityId> members;
    if (Value const* list = RecordFields::first(record, GROUP_MEMBER_FIELDS))
        members = RecordFields::idList(*list);

    std::optional<std::string> groupName = RecordFields::explicitName(record, NAME_FIELDS);

    EntityId canonical = 0;
    for (EntityId member : members)
    {
        if (isStation(member))
        {
            canonical = member;
            break;
        }
    }

    if (canonical != 0)
    {
        groupToStation[gid] = canonical;

        if (groupName)
        {
            for (EntityId member : members)
            {
                auto it = stationCache.find(member);
                if (it != stationCache.end() && RecordFields::isPlaceholderName(it->second.name))
                    it->second.name = *groupName;
            }
        }
        return;
    }

    Station station;
    station.id = gid;
    station.isGroup = true;
    station.name = groupName ? *groupName : "Station #" + std::to_string(gid);
    if (auto pos = RecordFields::position(record))
        station.pos = *pos;
    stationCache[gid] = std::move(station);
}

bool StationResolver::isStation(EntityId id) const
{
    return stationCache.count(id) > 0;
}

Station const* StationResolver::find(EntityId id) const
{
    auto it = stationCache.find(id);
    if (it == stationCache.end())
        return nullptr;
    return &it->second;
}

std::vector<Station> StationResolver::stations() const
{
    std::vector<Station> out;
    out.reserve(stationCache.size());
    for (auto const& kv : stationCache)
        out.push_back(kv.second);
    return out;
}

std::optional<EntityId> StationResolver::lookupAlias(EntityId id) const
{
    if (isStation(id))
        return id;

    auto g = groupToStation.find(id);
    if (g != groupToStation.end())
        return g->second;

    auto t = terminalToStation.find(id);
    if (t != terminalToStation.end())
        return t->second;

    return std::nullopt;
}

std::optional<EntityId> StationResolver::tryResolve(EntityId id)
{
    if (id == 0)
        return std::nullopt;

    if (auto alias = lookupAlias(id))
        return alias;

    std::optional<Value> ent = accessor.getEntity(id);
    if (!ent)
        return std::nullopt;

    for (auto const& field : REFERENCE_FIELDS)
    {
        EntityId ref = RecordFields::toEntityId(ent->field(field));
        if (ref == 0 || ref == id)
            continue;

        if (auto target = lookupAlias(ref))
        {
            terminalToStation[id] = *target;
            return target;
        }
    }
    return std::nullopt;
}

EntityId StationResolver::resolveToStationId(EntityId id)
{
    return tryResolve(id).value_or(id);
}

std::optional<EntityId> StationResolver::findStationIdDeep(Value const& record)
{
    BoundedSearch<EntityId> search(ID_SEARCH_DEPTH, DEEP_ID_FIELDS,
        [this](Value::Key const&, Value const& v) -> std::optional<EntityId>
        {
            if (!v.isNumber())
                return std::nullopt;
            return tryResolve(v.asInt().value_or(0));
        });
    return search.run(record);
}

static bool keyLooksLikeName(Value::Key const& key)
{
    auto const* name = std::get_if<std::string>(&key);
    if (!name)
        return false;

    std::string lower(*name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("name") != std::string::npos || lower == "label";
}

std::optional<std::string> StationResolver::resolveName(Value const& record, EntityId selfId)
{
    if (auto direct = RecordFields::explicitName(record, NAME_FIELDS))
        return direct;

    BoundedSearch<std::string> search(NAME_SEARCH_DEPTH, NAME_FIELDS,
        [](Value::Key const& key, Value const& v) -> std::optional<std::string>
        {
            auto const* s = v.asString();
            if (!s || !keyLooksLikeName(key) || RecordFields::isPlaceholderName(*s))
                return std::nullopt;
            return *s;
        });
    search.following(accessor, REFERENCE_FIELDS);
    return search.run(record, selfId);
}
