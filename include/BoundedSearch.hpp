#pragma once
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "EntityAccessor.hpp"
#include "Value.hpp"

// Depth-first walk over a host record looking for the first field the matcher
// accepts. Keys in `preferred` are visited first, in order, then the remaining
// table entries in key order. Integer fields named in `follow` are entity
// references and are expanded through the accessor, each entity at most once.
// Depth counts both nested tables and followed references.
template <typename R>
class BoundedSearch
{
public:
    using Matcher = std::function<std::optional<R>(Value::Key const& key, Value const& value)>;

    BoundedSearch(int maxDepth, std::vector<std::string> preferred, Matcher matcher)
        : maxDepth(maxDepth)
        , preferred(std::move(preferred))
        , matcher(std::move(matcher))
    {
    }

    BoundedSearch& following(EntityAccessor& entities, std::vector<std::string> keys)
    {
        accessor = &entities;
        follow = std::move(keys);
        return *this;
    }

    std::optional<R> run(Value const& root, EntityId rootId = 0)
    {
        visitedNodes.clear();
        visitedEntities.clear();
        fetched.clear();
        if (rootId != 0)
            visitedEntities.insert(rootId);
        return visit(root, 0);
    }

private:
    int maxDepth;
    std::vector<std::string> preferred;
    Matcher matcher;
    EntityAccessor* accessor = nullptr;
    std::vector<std::string> follow;

    std::unordered_set<Value const*> visitedNodes;
    std::unordered_set<EntityId> visitedEntities;
    std::deque<Value> fetched;

    bool isFollowKey(Value::Key const& key) const
    {
        auto const* name = std::get_if<std::string>(&key);
        if (!name || !accessor)
            return false;
        for (auto const& f : follow)
        {
            if (f == *name)
                return true;
        }
        return false;
    }

    std::optional<R> entry(Value::Key const& key, Value const& child, int depth)
    {
        if (auto hit = matcher(key, child))
            return hit;

        if (child.isTable() || child.isSequence())
            return visit(child, depth + 1);

        if (child.isNumber() && isFollowKey(key) && depth + 1 <= maxDepth)
        {
            EntityId ref = child.asInt().value_or(0);
            if (ref == 0 || !visitedEntities.insert(ref).second)
                return std::nullopt;

            std::optional<Value> target = accessor->getEntity(ref);
            if (!target)
                return std::nullopt;
            fetched.push_back(std::move(*target));
            return visit(fetched.back(), depth + 1);
        }
        return std::nullopt;
    }

    std::optional<R> visit(Value const& node, int depth)
    {
        if (depth > maxDepth)
            return std::nullopt;
        if (!visitedNodes.insert(&node).second)
            return std::nullopt;

        if (auto const* seq = node.asSequence())
        {
            for (std::size_t i = 0; i < seq->size(); ++i)
            {
                if (auto hit = entry(Value::Key{static_cast<std::int64_t>(i + 1)}, (*seq)[i], depth))
                    return hit;
            }
            return std::nullopt;
        }

        auto const* table = node.asTable();
        if (!table)
            return std::nullopt;

        for (auto const& key : preferred)
        {
            auto it = table->find(Value::Key{key});
            if (it == table->end())
                continue;
            if (auto hit = entry(it->first, it->second, depth))
                return hit;
        }

        for (auto const& [key, child] : *table)
        {
            if (auto const* name = std::get_if<std::string>(&key))
            {
                bool seen = false;
                for (auto const& p : preferred)
                {
                    if (p == *name)
                    {
                        seen = true;
                        break;
                    }
                }
                if (seen)
                    continue;
            }
            if (auto hit = entry(key, child, depth))
                return hit;
        }
        return std::nullopt;
    }
};
