#include "Value.hpp"

#include <cmath>

Value Value::opaque()
{
    Value v;
    v.storage = Opaque{};
    return v;
}

Value Value::table()
{
    return Value(Table{});
}

Value Value::sequence()
{
    return Value(Sequence{});
}

bool Value::isNull() const noexcept     { return std::holds_alternative<std::monostate>(storage); }
bool Value::isBool() const noexcept     { return std::holds_alternative<bool>(storage); }
bool Value::isInt() const noexcept      { return std::holds_alternative<std::int64_t>(storage); }
bool Value::isDouble() const noexcept   { return std::holds_alternative<double>(storage); }
bool Value::isNumber() const noexcept   { return isInt() || isDouble(); }
bool Value::isString() const noexcept   { return std::holds_alternative<std::string>(storage); }
bool Value::isSequence() const noexcept { return std::holds_alternative<Sequence>(storage); }
bool Value::isTable() const noexcept    { return std::holds_alternative<Table>(storage); }
bool Value::isOpaque() const noexcept   { return std::holds_alternative<Opaque>(storage); }

bool Value::truthy() const noexcept
{
    if (isNull())
        return false;
    if (auto const* b = std::get_if<bool>(&storage))
        return *b;
    return true;
}

std::optional<double> Value::asNumber() const noexcept
{
    if (auto const* i = std::get_if<std::int64_t>(&storage))
        return static_cast<double>(*i);
    if (auto const* d = std::get_if<double>(&storage))
        return *d;
    return std::nullopt;
}

std::optional<std::int64_t> Value::asInt() const noexcept
{
    if (auto const* i = std::get_if<std::int64_t>(&storage))
        return *i;
    if (auto const* d = std::get_if<double>(&storage))
    {
        double whole = std::floor(*d);
        // [-2^63, 2^63) is the range an int64 can hold.
        if (!std::isfinite(whole) || whole < -9223372036854775808.0 || whole >= 9223372036854775808.0)
            return std::nullopt;
        return static_cast<std::int64_t>(whole);
    }
    return std::nullopt;
}

std::string const* Value::asString() const noexcept
{
    return std::get_if<std::string>(&storage);
}

Value::Sequence const* Value::asSequence() const noexcept
{
    return std::get_if<Sequence>(&storage);
}

Value::Table const* Value::asTable() const noexcept
{
    return std::get_if<Table>(&storage);
}

Value const* Value::field(std::string const& key) const
{
    auto const* t = asTable();
    if (!t)
        return nullptr;

    auto it = t->find(Key{key});
    if (it == t->end() || it->second.isNull())
        return nullptr;
    return &it->second;
}

Value const* Value::index(std::int64_t position) const
{
    if (auto const* s = asSequence())
    {
        if (position < 1 || position > static_cast<std::int64_t>(s->size()))
            return nullptr;
        Value const& v = (*s)[static_cast<std::size_t>(position - 1)];
        return v.isNull() ? nullptr : &v;
    }

    if (auto const* t = asTable())
    {
        auto it = t->find(Key{position});
        if (it == t->end() || it->second.isNull())
            return nullptr;
        return &it->second;
    }

    return nullptr;
}

std::vector<Value const*> Value::elements() const
{
    std::vector<Value const*> out;

    if (auto const* s = asSequence())
    {
        out.reserve(s->size());
        for (auto const& v : *s)
        {
            if (v.isNull())
                break;
            out.push_back(&v);
        }
        return out;
    }

    if (asTable())
    {
        for (std::int64_t i = 1;; ++i)
        {
            Value const* v = index(i);
            if (!v)
                break;
            out.push_back(v);
        }
    }
    return out;
}

Value& Value::operator[](std::string const& key)
{
    if (isNull())
        storage = Table{};
    return std::get<Table>(storage)[Key{key}];
}

Value& Value::set(Key key, Value v)
{
    if (isNull())
        storage = Table{};
    std::get<Table>(storage)[std::move(key)] = std::move(v);
    return *this;
}

Value& Value::push(Value v)
{
    if (isNull())
        storage = Sequence{};
    std::get<Sequence>(storage).push_back(std::move(v));
    return *this;
}

std::string keyToString(Value::Key const& key)
{
    if (auto const* i = std::get_if<std::int64_t>(&key))
        return std::to_string(*i);
    return std::get<std::string>(key);
}
