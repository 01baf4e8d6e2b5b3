#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include "HostApi.hpp"
#include "Value.hpp"
#include "host_capture.pb.h"

// HostApi answering from one recorded frame. load() swaps in the next frame.
class CapturedHost : public HostApi
{
private:
    std::set<HostCall> calls;
    std::map<std::string, Value> lists;
    std::map<std::string, Value> regionLists;
    std::map<EntityId, Value> entities;
    std::map<std::pair<EntityId, std::string>, Value> components;
    Value time;
    std::uint64_t timestamp = 0;
    double dt = 0.0;

public:
    void load(transit_capture::HostFrame const& frame);

    [[nodiscard]] std::uint64_t frameTimestamp() const noexcept { return timestamp; }
    [[nodiscard]] double frameDelta() const noexcept { return dt; }

    bool provides(HostCall call) const override;
    Value getEntity(EntityId id) override;
    Value getEntityList(std::string const& typeKey) override;
    Value getComponent(EntityId id, std::string const& componentType) override;
    Value getEntitiesInRegion(Bounds const& bounds, std::string const& typeKey) override;
    Value getGameTime() override;

    static Value fromProto(transit_capture::HostValue const& v);
    static transit_capture::HostValue toProto(Value const& v);

    static HostCall fromProto(transit_capture::Capability c);
    static transit_capture::Capability toProto(HostCall call);
};
