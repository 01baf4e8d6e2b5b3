#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include "HostApi.hpp"
#include "Value.hpp"

// In-memory host. Everything is public so tests can reshape it between cycles.
class FakeHost : public HostApi
{
public:
    std::set<HostCall> calls = {HostCall::GetEntity, HostCall::GetEntityList, HostCall::GetComponent,
                                HostCall::GetEntitiesInRegion, HostCall::GetGameTime};
    std::map<std::string, Value> lists;
    std::map<EntityId, Value> entities;
    std::map<std::pair<EntityId, std::string>, Value> components;
    Value time;
    mutable int probes = 0;
    int entityCalls = 0;
    bool failEntities = false;
    bool foreignFailure = false;

    bool provides(HostCall call) const override
    {
        ++probes;
        return calls.count(call) > 0;
    }

    Value getEntity(EntityId id) override
    {
        ++entityCalls;
        if (foreignFailure)
            throw 42;
        if (failEntities)
            throw HostError("host crashed");
        auto it = entities.find(id);
        if (it == entities.end())
            throw HostError("no entity " + std::to_string(id));
        return it->second;
    }

    Value getEntityList(std::string const& typeKey) override
    {
        if (foreignFailure)
            throw "list unavailable";
        auto it = lists.find(typeKey);
        if (it == lists.end())
            throw HostError("unknown type " + typeKey);
        return it->second;
    }

    Value getComponent(EntityId id, std::string const& componentType) override
    {
        auto it = components.find({id, componentType});
        return it == components.end() ? Value() : it->second;
    }

    Value getEntitiesInRegion(Bounds const&, std::string const&) override
    {
        return Value::sequence();
    }

    Value getGameTime() override
    {
        if (foreignFailure)
            throw std::string("clock stopped");
        return time;
    }

    void list(std::string const& typeKey, std::initializer_list<EntityId> ids)
    {
        Value v = Value::sequence();
        for (EntityId id : ids)
            v.push(id);
        lists[typeKey] = std::move(v);
    }

    void component(EntityId id, std::string const& type, Value record)
    {
        components[{id, type}] = std::move(record);
    }
};

inline Value xyz(double x, double y, double z = 0.0)
{
    Value v = Value::table();
    v["x"] = x;
    v["y"] = y;
    v["z"] = z;
    return v;
}

inline Value record(std::initializer_list<std::pair<char const*, Value>> fields)
{
    Value v = Value::table();
    for (auto const& [key, value] : fields)
        v[key] = value;
    return v;
}

inline Value list(std::initializer_list<Value> items)
{
    Value v = Value::sequence();
    for (auto const& item : items)
        v.push(item);
    return v;
}

// One station "Central", one line Central -> unnamed terminal 42, one train
// at raw stop index 0, one rail edge and one signal.
inline void populateSmallNetwork(FakeHost& host)
{
    host.list("STATION", {10});
    host.entities[10] = record({{"name", "Central"}, {"position", xyz(100.0, 200.0, 5.0)}});

    host.list("LINE", {20});
    host.entities[20] = record({
        {"name", "Red Line"},
        {"vehicleType", "RAIL"},
        {"stops", list({record({{"station", 10}}), record({{"stationEntity", 42}})})},
    });

    host.list("VEHICLE", {30});
    host.entities[30] = record({
        {"name", "Train 1"},
        {"position", list({1.5, 2.5, 0.0})},
        {"line", 20},
        {"stopIndex", 0},
        {"carrier", "RAIL"},
        {"speed", 10.0},
        {"cargoLoad", record({{"PASSENGERS", 12}})},
        {"capacities", record({{"PASSENGERS", 80}})},
    });

    host.list("BASE_EDGE", {50});
    host.component(50, "BASE_EDGE", record({{"node0", 60}, {"node1", 61}}));
    host.component(50, "TRACK_EDGE", record({{"trackType", 1}}));
    host.component(60, "BASE_NODE", record({{"position", xyz(0.0, 0.0)}}));
    host.component(61, "BASE_NODE", record({{"position", xyz(10.0, 0.0)}}));

    host.list("SIGNAL", {70});
    host.entities[70] = record({{"position", xyz(5.0, 5.0)}});
    host.component(70, "SIGNAL", record({{"state", 1}}));

    host.time = record({{"year", 1950}, {"month", 3}});
}

class TempDir
{
public:
    TempDir()
    {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() /
               ("transit_telemetry_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(std::string const& name) const { return (path / name).string(); }

    std::filesystem::path path;
};

inline std::string readFile(std::string const& path)
{
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Parses JSON text with protobuf's JSON reader. Returns false on invalid JSON.
inline bool parseJson(std::string const& text, google::protobuf::Value& out)
{
    return google::protobuf::util::JsonStringToMessage(text, &out).ok();
}

inline google::protobuf::Value const& at(google::protobuf::Value const& v, std::string const& key)
{
    return v.struct_value().fields().at(key);
}

inline google::protobuf::Value const& at(google::protobuf::Value const& v, int index)
{
    return v.list_value().values(index);
}
