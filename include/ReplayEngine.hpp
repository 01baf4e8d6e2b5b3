#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include <utility>
#include <boost/asio.hpp>

class CapturedHost;
class SnapshotOrchestrator;

struct ReplayStats
{
    std::size_t frames = 0;
    std::size_t skipped = 0;
};

// Plays a capture file through the orchestrator, one frame per host tick.
class ReplayEngine
{
public:
    static ReplayStats run(std::string const& filename, CapturedHost& host, SnapshotOrchestrator& orchestrator, bool realtime);

    // Loads the first readable frame so capability probes see the recorded host.
    static bool prime(std::string const& filename, CapturedHost& host);

private:
    static boost::asio::awaitable<void> play(std::ifstream& file, CapturedHost& host, SnapshotOrchestrator& orchestrator,
                                             bool realtime, ReplayStats& stats);
    static bool readChunkHeader(std::ifstream& file, std::uint64_t& timestamp, std::uint32_t& size);
    static boost::asio::awaitable<void> syncRealtime(boost::asio::steady_timer& timer, std::uint64_t timestamp,
                                                     std::uint64_t& replayStart, std::uint64_t realStart);
    static bool processChunk(std::string const& data, CapturedHost& host, SnapshotOrchestrator& orchestrator);
};
