#include "CacheManager.hpp"

#include "NetworkScanner.hpp"

CacheManager::CacheManager(int trackPeriod, int signalPeriod)
    : trackCache("tracks", trackPeriod)
    , signalCache("signals", signalPeriod)
{
}

void CacheManager::update(EntityAccessor& accessor)
{
    trackCache.tick();
    signalCache.tick();

    if (trackCache.due())
    {
        if (trackCache.refresh([&] { return NetworkScanner::scanTracks(accessor); }))
            std::cout << "[Cache] tracks refreshed: " << trackCache.contents().size() << " edges\n";
    }

    if (signalCache.due())
    {
        if (signalCache.refresh([&] { return NetworkScanner::scanSignals(accessor); }))
            std::cout << "[Cache] signals refreshed: " << signalCache.contents().size() << " signals\n";
    }
}
