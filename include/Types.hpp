#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "Value.hpp"

struct Vec2
{
    double x = 0.0;
    double y = 0.0;
};

struct Vec3
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

using Polyline = std::vector<Vec2>;

struct Station
{
    EntityId id = 0;
    std::string name;
    Vec3 pos;
    bool isGroup = false;
};

// One entry of a line's stop list. index is 1-based.
struct Stop
{
    int index = 0;
    EntityId stationId = 0;
    EntityId rawStopId = 0;
    std::string name;
};

struct Line
{
    EntityId id = 0;
    std::string name;
    std::string vehicleType = "UNKNOWN";
    std::vector<Stop> stops;

    std::size_t stopCount() const noexcept { return stops.size(); }
};

// Rebuilt every cycle; only the numeric id is stable across snapshots.
struct Vehicle
{
    EntityId id = 0;
    std::string name;
    std::string type = "UNKNOWN";     // carrier: RAIL, ROAD, TRAM, WATER, AIR
    std::string state = "UNKNOWN";
    EntityId lineId = 0;
    std::string lineName;
    Vec3 position;
    double speedMs = 0.0;
    double speedKmh = 0.0;
    int direction = 1;
    std::int64_t passengers = 0;
    std::int64_t capacity = 0;
    std::int64_t cargo = 0;
    std::int64_t cargoCapacity = 0;
    EntityId lastStopId = 0;
    std::string lastStopName;
    EntityId nextStopId = 0;
    std::string nextStopName;
    std::int64_t rawStopIndex = -1;   // host's 0-based stop index, -1 when unknown
};

enum class EdgeKind
{
    Rail,
    Tram,
    Other
};

struct TrackEdge
{
    EntityId id = 0;
    EdgeKind kind = EdgeKind::Other;
    Polyline points;
};

enum class SignalState : int
{
    Unknown = -1,
    Stop    = 0,
    Proceed = 1
};

struct Signal
{
    EntityId id = 0;
    Vec3 pos;
    SignalState state = SignalState::Unknown;
};

// Coarse station-to-station shape of a line, not exact track routing.
struct Path
{
    EntityId lineId = 0;
    Polyline points;
};

struct Stats
{
    std::int64_t totalVehicles = 0;
    std::int64_t totalPassengers = 0;
    std::int64_t totalLines = 0;
    std::int64_t totalStations = 0;
    std::map<std::string, std::int64_t> vehiclesByType;
};

struct Snapshot
{
    static constexpr int SCHEMA_VERSION = 4;

    int schemaVersion = SCHEMA_VERSION;
    std::int64_t writeCount = 0;
    Value gameTime;
    Stats stats;
    std::vector<Vehicle> vehicles;
    std::vector<Line> lines;
    std::vector<Station> stations;
    std::vector<Path> paths;
    std::vector<TrackEdge> tracks;
    std::vector<Signal> signals;
};
