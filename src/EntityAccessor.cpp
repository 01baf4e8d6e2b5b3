#include "EntityAccessor.hpp"

#include <iostream>
#include <sstream>
#include "RecordFields.hpp"

char const* hostCallName(HostCall call) noexcept
{
    switch (call)
    {
        case HostCall::GetEntity:           return "getEntity";
        case HostCall::GetEntityList:       return "getEntityList";
        case HostCall::GetComponent:        return "getComponent";
        case HostCall::GetEntitiesInRegion: return "getEntitiesInRegion";
        case HostCall::GetGameTime:         return "getGameTime";
    }
    return "unknown";
}

char const* entityKindName(EntityKind kind) noexcept
{
    switch (kind)
    {
        case EntityKind::Vehicle:      return "vehicle";
        case EntityKind::Line:         return "line";
        case EntityKind::Station:      return "station";
        case EntityKind::StationGroup: return "station group";
        case EntityKind::Signal:       return "signal";
        case EntityKind::Edge:         return "edge";
    }
    return "unknown";
}

std::vector<std::string> const& EntityAccessor::typeKeys(EntityKind kind)
{
    static const std::vector<std::string> vehicles = {"VEHICLE", "TRANSPORT_VEHICLE", "Vehicle", "vehicle"};
    static const std::vector<std::string> lines    = {"LINE", "entity.LINE", "TRANSPORT_LINE"};
    static const std::vector<std::string> stations = {"STATION", "entity.STATION"};
    static const std::vector<std::string> groups   = {"STATION_GROUP", "entity.STATION_GROUP"};
    // Raw numeric ids are the signal entity types of older host builds.
    static const std::vector<std::string> signals  = {"SIGNAL", "RAIL_SIGNAL", "RAILROAD_SIGNAL", "18", "17", "16", "19", "20"};
    static const std::vector<std::string> edges    = {"BASE_EDGE", "TRACK_EDGE", "STREET_EDGE"};

    switch (kind)
    {
        case EntityKind::Vehicle:      return vehicles;
        case EntityKind::Line:         return lines;
        case EntityKind::Station:      return stations;
        case EntityKind::StationGroup: return groups;
        case EntityKind::Signal:       return signals;
        case EntityKind::Edge:         return edges;
    }
    return vehicles;
}

EntityAccessor::EntityAccessor(HostApi& h)
    : host(h)
{
    for (std::size_t i = 0; i < ALL_HOST_CALLS.size(); ++i)
    {
        try
        {
            available[i] = host.provides(ALL_HOST_CALLS[i]);
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Accessor] Probing " << hostCallName(ALL_HOST_CALLS[i])
                      << " failed: " << e.what() << "\n";
            available[i] = false;
        }
        catch (...)
        {
            reportForeignFailure(ALL_HOST_CALLS[i]);
            available[i] = false;
        }
    }
}

bool EntityAccessor::provides(HostCall call) const noexcept
{
    return available[static_cast<std::size_t>(call)];
}

bool EntityAccessor::require(HostCall call)
{
    if (provides(call))
        return true;

    if (reported.insert(call).second)
    {
        std::cout << "[Accessor] Host does not provide " << hostCallName(call)
                  << ", continuing without it." << std::endl;
    }
    return false;
}

void EntityAccessor::reportForeignFailure(HostCall call) const
{
    std::cerr << "[Accessor] " << hostCallName(call) << " threw a non-standard exception, treating it as absent\n";
}

std::optional<Value> EntityAccessor::getEntity(EntityId id)
{
    if (id == 0 || !require(HostCall::GetEntity))
        return std::nullopt;

    try
    {
        Value v = host.getEntity(id);
        if (v.isNull())
            return std::nullopt;
        return v;
    }
    catch (std::exception const&)
    {
        return std::nullopt;
    }
    catch (...)
    {
        reportForeignFailure(HostCall::GetEntity);
        return std::nullopt;
    }
}

std::optional<Value> EntityAccessor::getComponent(EntityId id, std::string const& componentType)
{
    if (id == 0 || !require(HostCall::GetComponent))
        return std::nullopt;

    try
    {
        Value v = host.getComponent(id, componentType);
        if (v.isNull())
            return std::nullopt;
        return v;
    }
    catch (std::exception const&)
    {
        return std::nullopt;
    }
    catch (...)
    {
        reportForeignFailure(HostCall::GetComponent);
        return std::nullopt;
    }
}

std::optional<Value> EntityAccessor::gameTime()
{
    if (!require(HostCall::GetGameTime))
        return std::nullopt;

    try
    {
        Value v = host.getGameTime();
        if (v.isNull())
            return std::nullopt;
        return v;
    }
    catch (std::exception const&)
    {
        return std::nullopt;
    }
    catch (...)
    {
        reportForeignFailure(HostCall::GetGameTime);
        return std::nullopt;
    }
}

std::vector<EntityId> EntityAccessor::listFor(std::string const& typeKey, Bounds const* region)
{
    try
    {
        Value list = region ? host.getEntitiesInRegion(*region, typeKey)
                            : host.getEntityList(typeKey);
        return RecordFields::idList(list);
    }
    catch (std::exception const&)
    {
        return {};
    }
    catch (...)
    {
        reportForeignFailure(region ? HostCall::GetEntitiesInRegion : HostCall::GetEntityList);
        return {};
    }
}

std::vector<EntityId> EntityAccessor::enumerate(EntityKind kind)
{
    if (!require(HostCall::GetEntityList))
        return {};

    std::vector<std::string> order;
    auto cached = winningKey.find(kind);
    if (cached != winningKey.end())
        order.push_back(cached->second);
    for (auto const& key : typeKeys(kind))
    {
        if (cached == winningKey.end() || key != cached->second)
            order.push_back(key);
    }

    for (auto const& key : order)
    {
        std::vector<EntityId> ids = listFor(key, nullptr);
        if (!ids.empty())
        {
            winningKey[kind] = key;
            return ids;
        }
    }
    return {};
}

std::vector<EntityId> EntityAccessor::enumerateRegion(Bounds const& bounds, EntityKind kind)
{
    if (!require(HostCall::GetEntitiesInRegion))
        return {};

    for (auto const& key : typeKeys(kind))
    {
        std::vector<EntityId> ids = listFor(key, &bounds);
        if (!ids.empty())
            return ids;
    }
    return {};
}

std::string EntityAccessor::describe() const
{
    std::ostringstream out;
    out << "=== Host capability report ===\n";
    for (HostCall call : ALL_HOST_CALLS)
        out << hostCallName(call) << ": " << (provides(call) ? "available" : "missing") << "\n";

    out << "--- Enumeration ---\n";
    for (EntityKind kind : {EntityKind::Vehicle, EntityKind::Line, EntityKind::Station,
                            EntityKind::StationGroup, EntityKind::Signal, EntityKind::Edge})
    {
        auto it = winningKey.find(kind);
        out << entityKindName(kind) << ": "
            << (it != winningKey.end() ? it->second : std::string("(no hit)")) << "\n";
    }
    return out.str();
}
