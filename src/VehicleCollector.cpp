#include "VehicleCollector.hpp"

#include <tuple>
#include <unordered_map>
#include <utility>
#include "RecordFields.hpp"

static bool isPassengerKey(Value::Key const& key)
{
    auto const* name = std::get_if<std::string>(&key);
    return name && (*name == "PASSENGERS" || *name == "passengers");
}

// Splits a per-cargo-type table into (passengers, everything else).
static std::pair<std::int64_t, std::int64_t> splitLoad(Value const* table)
{
    std::int64_t passengers = 0;
    std::int64_t other = 0;
    if (!table || !table->isTable())
        return {0, 0};

    passengers = RecordFields::toInt(RecordFields::first(*table, {"PASSENGERS", "passengers"}));
    for (auto const& [key, value] : *table->asTable())
    {
        if (!isPassengerKey(key))
            other += RecordFields::toInt(&value);
    }
    return {passengers, other};
}

double VehicleCollector::msToKmh(double ms) noexcept
{
    return RecordFields::round(ms * 3.6, 1);
}

Vehicle VehicleCollector::readVehicle(EntityId id, Value const& record)
{
    Vehicle v;
    v.id = id;

    v.name = RecordFields::toStr(record.field("name"));
    if (v.name.empty())
        v.name = "Vehicle #" + std::to_string(id);

    if (auto pos = RecordFields::position(record))
        v.position = *pos;

    v.speedMs  = RecordFields::toFloat(RecordFields::first(record, SPEED_FIELDS), 3);
    v.speedKmh = msToKmh(v.speedMs);

    Value const* line = RecordFields::first(record, LINE_ID_FIELDS);
    if (!line)
    {
        if (Value const* tv = record.field("transportVehicle"))
            line = tv->field("lineIdx");
    }
    v.lineId = RecordFields::toInt(line);

    std::tie(v.passengers, v.cargo)       = splitLoad(record.field("cargoLoad"));
    std::tie(v.capacity, v.cargoCapacity) = splitLoad(record.field("capacities"));

    std::string state = RecordFields::toStr(record.field("state"));
    if (!state.empty())
        v.state = state;

    std::string carrier = RecordFields::toStr(record.field("carrier"));
    if (!carrier.empty())
        v.type = carrier;

    if (Value const* idx = record.field("stopIndex"))
        v.rawStopIndex = idx->asInt().value_or(-1);

    return v;
}

bool VehicleCollector::keep(Vehicle const& v, CollectorOptions const& options)
{
    if (!options.includeCargo && v.capacity == 0 && v.cargoCapacity > 0)
        return false;
    if (!options.includeBuses && (v.type == "ROAD" || v.type == "TRAM"))
        return false;
    return true;
}

std::vector<Vehicle> VehicleCollector::collect(EntityAccessor& accessor, CollectorOptions const& options)
{
    std::vector<Vehicle> vehicles;

    for (EntityId vid : accessor.enumerate(EntityKind::Vehicle))
    {
        std::optional<Value> record = accessor.getEntity(vid);
        if (!record)
            continue;

        Vehicle v = readVehicle(vid, *record);
        if (keep(v, options))
            vehicles.push_back(std::move(v));
    }
    return vehicles;
}

void VehicleCollector::applyStopIndex(Vehicle& v, Line const& line)
{
    std::int64_t count = static_cast<std::int64_t>(line.stopCount());
    if (v.rawStopIndex < 0 || v.rawStopIndex >= count)
        return;

    // The host index names the stop just served; the next one follows it
    // and wraps to the first stop after the end of the loop.
    std::size_t last = static_cast<std::size_t>(v.rawStopIndex);
    std::size_t next = static_cast<std::size_t>((v.rawStopIndex + 1) % count);

    Stop const& ls = line.stops[last];
    EntityId lastId = ls.stationId != 0 ? ls.stationId : ls.rawStopId;
    if (lastId != 0)
        v.lastStopId = lastId;
    v.lastStopName = ls.name;

    Stop const& ns = line.stops[next];
    EntityId nextId = ns.stationId != 0 ? ns.stationId : ns.rawStopId;
    if (nextId != 0)
        v.nextStopId = nextId;
    v.nextStopName = ns.name;
}

void VehicleCollector::enrich(std::vector<Vehicle>& vehicles, std::vector<Line> const& lines)
{
    std::unordered_map<EntityId, Line const*> byId;
    for (auto const& line : lines)
        byId[line.id] = &line;

    for (auto& v : vehicles)
    {
        if (v.lineId == 0)
            continue;
        auto it = byId.find(v.lineId);
        if (it == byId.end())
            continue;

        v.lineName = it->second->name;
        applyStopIndex(v, *it->second);
    }
}
