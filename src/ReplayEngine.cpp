#include "ReplayEngine.hpp"
#include <boost/asio/co_spawn.hpp>
#include <chrono>
#include <ctime>
#include <exception>
#include <stdexcept>
#include <iostream>
#include "CapturedHost.hpp"
#include "SnapshotOrchestrator.hpp"
#include "host_capture.pb.h"

bool ReplayEngine::readChunkHeader(std::ifstream& file, std::uint64_t& timestamp, std::uint32_t& size)
{
    file.read(reinterpret_cast<char*>(&timestamp), sizeof(timestamp));
    file.read(reinterpret_cast<char*>(&size), sizeof(size));

    if (file.eof() || !file.good())
        return false;

    return true;
}

boost::asio::awaitable<void> ReplayEngine::syncRealtime(boost::asio::steady_timer& timer, std::uint64_t timestamp,
                                                        std::uint64_t& replayStart, std::uint64_t realStart)
{
    if (replayStart == 0)
    {
        replayStart = timestamp;
    }

    std::uint64_t recordingDelta = timestamp > replayStart ? timestamp - replayStart : 0;
    std::uint64_t realDelta      = static_cast<std::uint64_t>(std::time(nullptr)) - realStart;

    if (recordingDelta > realDelta)
    {
        std::uint64_t waitSeconds = recordingDelta - realDelta;
        if (waitSeconds > 1)
        {
            std::cout << "[Replay] Syncing... sleeping for "
                      << waitSeconds << "s" << std::endl;
        }
        timer.expires_after(std::chrono::seconds(waitSeconds));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

bool ReplayEngine::processChunk(std::string const& data, CapturedHost& host, SnapshotOrchestrator& orchestrator)
{
    transit_capture::HostFrame frame;
    if (!frame.ParseFromString(data))
    {
        std::cerr << "[Replay] Skipping unreadable frame (" << data.size() << " bytes)" << std::endl;
        return false;
    }

    try
    {
        host.load(frame);
    }
    catch (HostError const& e)
    {
        std::cerr << "[Replay] Skipping frame T=" << frame.timestamp() << ": " << e.what() << std::endl;
        return false;
    }

    if (frame.dt() > 0.0)
        orchestrator.onTick(frame.dt());
    else
        orchestrator.onEvent();
    return true;
}

boost::asio::awaitable<void> ReplayEngine::play(std::ifstream& file, CapturedHost& host, SnapshotOrchestrator& orchestrator,
                                                bool realtime, ReplayStats& stats)
{
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    std::uint64_t replayStart = 0;
    std::uint64_t realStart   = static_cast<std::uint64_t>(std::time(nullptr));

    while (file.peek() != EOF)
    {
        std::uint64_t timestamp = 0;
        std::uint32_t size      = 0;

        if (!readChunkHeader(file, timestamp, size))
            break;

        if (realtime)
            co_await syncRealtime(timer, timestamp, replayStart, realStart);

        std::string data(size, '\0');
        file.read(&data[0], size);
        if (static_cast<std::uint32_t>(file.gcount()) != size)
        {
            std::cerr << "[Replay] Truncated frame at T=" << timestamp << ", stopping" << std::endl;
            ++stats.skipped;
            break;
        }

        if (processChunk(data, host, orchestrator))
            ++stats.frames;
        else
            ++stats.skipped;
    }
}

bool ReplayEngine::prime(std::string const& filename, CapturedHost& host)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
        return false;

    std::uint64_t timestamp = 0;
    std::uint32_t size      = 0;
    while (file.peek() != EOF && readChunkHeader(file, timestamp, size))
    {
        std::string data(size, '\0');
        file.read(&data[0], size);
        if (static_cast<std::uint32_t>(file.gcount()) != size)
            return false;

        transit_capture::HostFrame frame;
        if (!frame.ParseFromString(data))
            continue;

        try
        {
            host.load(frame);
            return true;
        }
        catch (HostError const& e)
        {
            std::cerr << "[Replay] Frame T=" << timestamp << " unusable for priming: " << e.what() << std::endl;
        }
    }
    return false;
}

ReplayStats ReplayEngine::run(std::string const& filename, CapturedHost& host, SnapshotOrchestrator& orchestrator, bool realtime)
{
    ReplayStats stats;

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open replay file: " + filename);
    }

    std::cout << "[Replay] Starting " << filename
              << (realtime ? " (1:1 speed)" : " (as fast as possible)") << std::endl;

    boost::asio::io_context io;
    boost::asio::co_spawn(io, play(file, host, orchestrator, realtime, stats),
                          [](std::exception_ptr e)
                          {
                              if (e)
                                  std::rethrow_exception(e);
                          });
    io.run();

    std::cout << "[Replay] Complete: " << stats.frames << " frames, "
              << stats.skipped << " skipped" << std::endl;
    return stats;
}
