#include "Serializer.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

std::string Serializer::encode(Value const& value)
{
    std::string out;
    encodeInto(out, value, 0);
    return out;
}

bool Serializer::isArrayTable(Value::Table const& table)
{
    if (table.empty())
        return false;

    // Integer keys order before string keys, so the first and last entries
    // bound the whole key set.
    auto const* lo = std::get_if<std::int64_t>(&table.begin()->first);
    auto const* hi = std::get_if<std::int64_t>(&table.rbegin()->first);
    return lo && hi && *lo == 1 && *hi == static_cast<std::int64_t>(table.size());
}

std::string Serializer::escape(std::string const& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out += c;
                }
        }
    }
    return out;
}

void Serializer::encodeNumber(std::string& out, double d)
{
    if (!std::isfinite(d))
    {
        out += "null";
        return;
    }

    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{})
    {
        out += "null";
        return;
    }
    out.append(buf, end);
}

void Serializer::encodeInto(std::string& out, Value const& value, int depth)
{
    if (depth > MAX_DEPTH)
    {
        out += "null";
        return;
    }

    std::visit([&](auto const& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, bool>)
        {
            out += v ? "true" : "false";
        }
        else if constexpr (std::is_same_v<T, std::int64_t>)
        {
            out += std::to_string(v);
        }
        else if constexpr (std::is_same_v<T, double>)
        {
            encodeNumber(out, v);
        }
        else if constexpr (std::is_same_v<T, std::string>)
        {
            out += '"';
            out += escape(v);
            out += '"';
        }
        else if constexpr (std::is_same_v<T, Value::Sequence>)
        {
            out += '[';
            for (std::size_t i = 0; i < v.size(); ++i)
            {
                if (i > 0)
                    out += ',';
                encodeInto(out, v[i], depth + 1);
            }
            out += ']';
        }
        else if constexpr (std::is_same_v<T, Value::Table>)
        {
            if (isArrayTable(v))
            {
                out += '[';
                bool firstItem = true;
                for (auto const& entry : v)
                {
                    if (!firstItem)
                        out += ',';
                    firstItem = false;
                    encodeInto(out, entry.second, depth + 1);
                }
                out += ']';
                return;
            }

            std::vector<std::pair<std::string, Value const*>> entries;
            entries.reserve(v.size());
            for (auto const& [key, item] : v)
                entries.emplace_back(keyToString(key), &item);
            std::stable_sort(entries.begin(), entries.end(),
                             [](auto const& a, auto const& b) { return a.first < b.first; });

            out += '{';
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                if (i > 0)
                    out += ',';
                out += '"';
                out += escape(entries[i].first);
                out += "\":";
                encodeInto(out, *entries[i].second, depth + 1);
            }
            out += '}';
        }
        else
        {
            // null and opaque host handles
            out += "null";
        }
    }, value.data());
}
