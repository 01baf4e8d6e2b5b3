#pragma once
#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "HostApi.hpp"
#include "Value.hpp"

enum class EntityKind
{
    Vehicle,
    Line,
    Station,
    StationGroup,
    Signal,
    Edge
};

char const* entityKindName(EntityKind kind) noexcept;

// Guarded access to the host. Host failures never leave this class: every
// call returns an empty list or std::nullopt instead. Which host calls exist
// is probed once on construction.
class EntityAccessor
{
public:
    explicit EntityAccessor(HostApi& host);

    [[nodiscard]] bool provides(HostCall call) const noexcept;

    std::optional<Value> getEntity(EntityId id);
    std::optional<Value> getComponent(EntityId id, std::string const& componentType);
    std::optional<Value> gameTime();

    // Tries the kind's type keys in order; the key that last produced
    // entities is tried first on later calls.
    std::vector<EntityId> enumerate(EntityKind kind);
    std::vector<EntityId> enumerateRegion(Bounds const& bounds, EntityKind kind);

    std::string describe() const;

    static std::vector<std::string> const& typeKeys(EntityKind kind);

private:
    HostApi& host;
    std::array<bool, ALL_HOST_CALLS.size()> available{};
    std::map<EntityKind, std::string> winningKey;
    std::set<HostCall> reported;

    bool require(HostCall call);
    void reportForeignFailure(HostCall call) const;
    std::vector<EntityId> listFor(std::string const& typeKey, Bounds const* region);
};
