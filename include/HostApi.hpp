#pragma once
#include <array>
#include <stdexcept>
#include <string>
#include "Value.hpp"

enum class HostCall
{
    GetEntity,
    GetEntityList,
    GetComponent,
    GetEntitiesInRegion,
    GetGameTime
};

inline constexpr std::array<HostCall, 5> ALL_HOST_CALLS = {
    HostCall::GetEntity,
    HostCall::GetEntityList,
    HostCall::GetComponent,
    HostCall::GetEntitiesInRegion,
    HostCall::GetGameTime
};

char const* hostCallName(HostCall call) noexcept;

struct Bounds
{
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
};

class HostError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The simulation's scripting surface. Any call may throw; which calls exist at
// all depends on the host version and is reported by provides().
class HostApi
{
public:
    virtual ~HostApi() = default;

    virtual bool provides(HostCall call) const = 0;

    virtual Value getEntity(EntityId id) = 0;
    // Returns a list whose elements are ids or records carrying an id.
    virtual Value getEntityList(std::string const& typeKey) = 0;
    virtual Value getComponent(EntityId id, std::string const& componentType) = 0;
    virtual Value getEntitiesInRegion(Bounds const& bounds, std::string const& typeKey) = 0;
    virtual Value getGameTime() = 0;
};
