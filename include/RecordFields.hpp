#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Value.hpp"

// Defensive readers for host records. Missing or mistyped fields read as the
// zero value of the requested type.
class RecordFields
{
public:
    static std::int64_t toInt(Value const* v) noexcept;
    static double toFloat(Value const* v, int digits = 2) noexcept;
    static std::string toStr(Value const* v);
    static EntityId toEntityId(Value const* v);

    static double round(double value, int digits) noexcept;

    // First field that is present and truthy, in the given order.
    static Value const* first(Value const& record, std::initializer_list<char const*> keys);
    static Value const* first(Value const& record, std::vector<std::string> const& keys);

    // position[1..3] / position.{x,y,z}, else a 4x4 transform.
    static std::optional<Vec3> position(Value const& record);
    static Vec3 transformTranslation(Value const& transform);
    static std::optional<Vec2> point(Value const& pt);

    static std::vector<EntityId> idList(Value const& list);

    // "", whitespace, "Stop #<n>" and "Station #<n>" are auto-generated labels.
    static bool isPlaceholderName(std::string const& name);

    // First string field that is a usable (non-placeholder) name.
    static std::optional<std::string> explicitName(Value const& record, std::vector<std::string> const& keys);

    static inline const std::vector<std::string> ENTITY_ID_FIELDS = {"entity", "id", "entityId", "entity_id"};
};
