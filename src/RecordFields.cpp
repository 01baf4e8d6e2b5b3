#include "RecordFields.hpp"

#include <cctype>
#include <cmath>

std::int64_t RecordFields::toInt(Value const* v) noexcept
{
    if (!v)
        return 0;
    return v->asInt().value_or(0);
}

double RecordFields::round(double value, int digits) noexcept
{
    if (!std::isfinite(value))
        return 0.0;
    double factor = std::pow(10.0, digits);
    return std::floor(value * factor + 0.5) / factor;
}

double RecordFields::toFloat(Value const* v, int digits) noexcept
{
    if (!v)
        return 0.0;
    auto n = v->asNumber();
    if (!n)
        return 0.0;
    return round(*n, digits);
}

std::string RecordFields::toStr(Value const* v)
{
    if (!v)
        return "";
    if (auto const* s = v->asString())
        return *s;
    return "";
}

EntityId RecordFields::toEntityId(Value const* v)
{
    if (!v)
        return 0;
    if (v->isNumber())
        return toInt(v);
    if (v->isTable())
        return toInt(first(*v, ENTITY_ID_FIELDS));
    return 0;
}

Value const* RecordFields::first(Value const& record, std::initializer_list<char const*> keys)
{
    for (char const* key : keys)
    {
        Value const* v = record.field(key);
        if (v && v->truthy())
            return v;
    }
    return nullptr;
}

Value const* RecordFields::first(Value const& record, std::vector<std::string> const& keys)
{
    for (auto const& key : keys)
    {
        Value const* v = record.field(key);
        if (v && v->truthy())
            return v;
    }
    return nullptr;
}

static Value const* firstOf(Value const* a, Value const* b)
{
    return a ? a : b;
}

std::optional<Vec3> RecordFields::position(Value const& record)
{
    if (Value const* pos = record.field("position"))
    {
        Vec3 out;
        out.x = toFloat(firstOf(pos->index(1), pos->field("x")));
        out.y = toFloat(firstOf(pos->index(2), pos->field("y")));
        out.z = toFloat(firstOf(pos->index(3), pos->field("z")));
        return out;
    }

    if (Value const* xf = record.field("transform"))
        return transformTranslation(*xf);

    return std::nullopt;
}

Vec3 RecordFields::transformTranslation(Value const& xf)
{
    // Column-major 4x4: translation sits in 13..15; row-major hosts put it in 4, 8, 12.
    Vec3 out;
    out.x = toFloat(firstOf(xf.index(13), xf.index(4)));
    out.y = toFloat(firstOf(xf.index(14), xf.index(8)));
    out.z = toFloat(firstOf(xf.index(15), xf.index(12)));
    return out;
}

std::optional<Vec2> RecordFields::point(Value const& pt)
{
    if (!pt.isTable() && !pt.isSequence())
        return std::nullopt;

    Value const* x = pt.field("x");
    if (!x) x = pt.index(1);
    if (!x) x = pt.index(0);

    Value const* y = pt.field("y");
    if (!y) y = pt.index(2);
    if (!y) y = pt.index(1);

    if (!x || !y || !x->isNumber() || !y->isNumber())
        return std::nullopt;

    return Vec2{toFloat(x), toFloat(y)};
}

std::vector<EntityId> RecordFields::idList(Value const& list)
{
    std::vector<EntityId> ids;
    for (Value const* element : list.elements())
    {
        EntityId id = toEntityId(element);
        if (id != 0)
            ids.push_back(id);
    }
    return ids;
}

static bool isNumberedLabel(std::string const& name, std::string const& prefix)
{
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
        return false;

    for (std::size_t i = prefix.size(); i < name.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(name[i])))
            return false;
    }
    return true;
}

bool RecordFields::isPlaceholderName(std::string const& name)
{
    bool blank = true;
    for (char c : name)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
        {
            blank = false;
            break;
        }
    }
    if (blank)
        return true;

    return isNumberedLabel(name, "Stop #") || isNumberedLabel(name, "Station #");
}

std::optional<std::string> RecordFields::explicitName(Value const& record, std::vector<std::string> const& keys)
{
    for (auto const& key : keys)
    {
        Value const* v = record.field(key);
        if (!v)
            continue;
        if (auto const* s = v->asString(); s && !isPlaceholderName(*s))
            return *s;
    }
    return std::nullopt;
}
