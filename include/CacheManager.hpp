#pragma once
#include <iostream>
#include <utility>
#include <vector>
#include "EntityAccessor.hpp"
#include "StageResult.hpp"
#include "Types.hpp"

// Contents plus an age counted in snapshot cycles. A failed refresh keeps
// the last good contents.
template <typename T>
class RefreshingCache
{
private:
    char const* label;
    int period;
    int ageCycles = 0;
    bool loaded = false;
    T data{};

public:
    RefreshingCache(char const* label, int period)
        : label(label)
        , period(period > 0 ? period : 1)
    {
    }

    void tick() noexcept { ++ageCycles; }

    [[nodiscard]] bool due() const noexcept { return !loaded || ageCycles >= period; }

    template <typename Fn>
    bool refresh(Fn&& fn)
    {
        StageResult<T> result = std::forward<Fn>(fn)();
        if (!result)
        {
            std::cerr << "[Cache] " << label << " refresh failed: " << result.error().message
                      << " (keeping data aged " << ageCycles << " cycles)\n";
            return false;
        }
        data = std::move(result).value();
        ageCycles = 0;
        loaded = true;
        return true;
    }

    [[nodiscard]] T const& contents() const noexcept { return data; }
    [[nodiscard]] int age() const noexcept { return ageCycles; }
    [[nodiscard]] int refreshPeriod() const noexcept { return period; }
    [[nodiscard]] bool hasData() const noexcept { return loaded; }
};

class CacheManager
{
private:
    RefreshingCache<std::vector<TrackEdge>> trackCache;
    RefreshingCache<std::vector<Signal>> signalCache;

public:
    static constexpr int DEFAULT_TRACK_PERIOD = 30;
    static constexpr int DEFAULT_SIGNAL_PERIOD = 10;

    CacheManager(int trackPeriod = DEFAULT_TRACK_PERIOD, int signalPeriod = DEFAULT_SIGNAL_PERIOD);

    // Once per snapshot cycle: ages both caches and refreshes those due.
    void update(EntityAccessor& accessor);

    [[nodiscard]] std::vector<TrackEdge> const& tracks() const noexcept { return trackCache.contents(); }
    [[nodiscard]] std::vector<Signal> const& signals() const noexcept { return signalCache.contents(); }

    RefreshingCache<std::vector<TrackEdge>>& trackState() noexcept { return trackCache; }
    RefreshingCache<std::vector<Signal>>& signalState() noexcept { return signalCache; }
};
