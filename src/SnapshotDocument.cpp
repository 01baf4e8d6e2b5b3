#include "SnapshotDocument.hpp"

#include "NetworkScanner.hpp"

static Value vec3(Vec3 const& p)
{
    Value v = Value::table();
    v["x"] = p.x;
    v["y"] = p.y;
    v["z"] = p.z;
    return v;
}

static Value polyline(Polyline const& pts)
{
    Value out = Value::sequence();
    for (auto const& p : pts)
    {
        Value point = Value::table();
        point["x"] = p.x;
        point["y"] = p.y;
        out.push(std::move(point));
    }
    return out;
}

template <typename T, typename Fn>
static Value sequenceOf(std::vector<T> const& items, Fn&& convert)
{
    Value out = Value::sequence();
    for (auto const& item : items)
        out.push(convert(item));
    return out;
}

Value SnapshotDocument::vehicleValue(Vehicle const& v)
{
    Value out = Value::table();
    out["id"] = v.id;
    out["name"] = v.name;
    out["type"] = v.type;
    out["state"] = v.state;
    out["line_id"] = v.lineId;
    out["line_name"] = v.lineName;
    out["position"] = vec3(v.position);
    out["speed_ms"] = v.speedMs;
    out["speed_kmh"] = v.speedKmh;
    out["direction"] = v.direction;
    out["passengers"] = v.passengers;
    out["capacity"] = v.capacity;
    out["cargo"] = v.cargo;
    out["cargo_capacity"] = v.cargoCapacity;
    out["last_stop_id"] = v.lastStopId;
    out["last_stop_name"] = v.lastStopName;
    out["next_stop_id"] = v.nextStopId;
    out["next_stop_name"] = v.nextStopName;
    out["raw_stop_index"] = v.rawStopIndex;
    return out;
}

Value SnapshotDocument::lineValue(Line const& line)
{
    Value stops = Value::sequence();
    for (auto const& s : line.stops)
    {
        Value stop = Value::table();
        stop["index"] = s.index;
        stop["station_id"] = s.stationId;
        stop["raw_stop_id"] = s.rawStopId;
        stop["name"] = s.name;
        stops.push(std::move(stop));
    }

    Value out = Value::table();
    out["id"] = line.id;
    out["name"] = line.name;
    out["vehicle_type"] = line.vehicleType;
    out["stops"] = std::move(stops);
    out["stop_count"] = line.stopCount();
    return out;
}

Value SnapshotDocument::stationValue(Station const& s)
{
    Value out = Value::table();
    out["id"] = s.id;
    out["name"] = s.name;
    out["pos"] = vec3(s.pos);
    out["is_group"] = s.isGroup;
    return out;
}

Value SnapshotDocument::pathValue(Path const& p)
{
    Value out = Value::table();
    out["line_id"] = p.lineId;
    out["points"] = polyline(p.points);
    return out;
}

Value SnapshotDocument::trackValue(TrackEdge const& t)
{
    Value out = Value::table();
    out["id"] = t.id;
    out["kind"] = NetworkScanner::edgeKindName(t.kind);
    out["points"] = polyline(t.points);
    return out;
}

Value SnapshotDocument::signalValue(Signal const& s)
{
    Value out = Value::table();
    out["id"] = s.id;
    out["pos"] = vec3(s.pos);
    out["state"] = static_cast<int>(s.state);
    return out;
}

Stats SnapshotDocument::buildStats(std::vector<Vehicle> const& vehicles, std::size_t lineCount, std::size_t stationCount)
{
    Stats stats;
    stats.totalVehicles = static_cast<std::int64_t>(vehicles.size());
    stats.totalLines = static_cast<std::int64_t>(lineCount);
    stats.totalStations = static_cast<std::int64_t>(stationCount);
    for (auto const& v : vehicles)
    {
        stats.totalPassengers += v.passengers;
        ++stats.vehiclesByType[v.type];
    }
    return stats;
}

Snapshot SnapshotDocument::fallback(std::int64_t writeCount)
{
    Snapshot snapshot;
    snapshot.writeCount = writeCount;
    return snapshot;
}

Value SnapshotDocument::toValue(Snapshot const& snapshot)
{
    Value byType = Value::table();
    for (auto const& [type, count] : snapshot.stats.vehiclesByType)
        byType[type] = count;

    Value stats = Value::table();
    stats["total_vehicles"] = snapshot.stats.totalVehicles;
    stats["total_passengers"] = snapshot.stats.totalPassengers;
    stats["total_lines"] = snapshot.stats.totalLines;
    stats["total_stations"] = snapshot.stats.totalStations;
    stats["vehicles_by_type"] = std::move(byType);

    Value doc = Value::table();
    doc["schema_version"] = snapshot.schemaVersion;
    doc["write_count"] = snapshot.writeCount;
    doc["game_time"] = snapshot.gameTime;
    doc["stats"] = std::move(stats);
    doc["vehicles"] = sequenceOf(snapshot.vehicles, vehicleValue);
    doc["lines"] = sequenceOf(snapshot.lines, lineValue);
    doc["stations"] = sequenceOf(snapshot.stations, stationValue);
    doc["paths"] = sequenceOf(snapshot.paths, pathValue);
    doc["tracks"] = sequenceOf(snapshot.tracks, trackValue);
    doc["signals"] = sequenceOf(snapshot.signals, signalValue);
    return doc;
}
