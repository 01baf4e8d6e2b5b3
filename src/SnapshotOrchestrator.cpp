#include "SnapshotOrchestrator.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>
#include "LineResolver.hpp"
#include "PathBuilder.hpp"
#include "Serializer.hpp"
#include "SnapshotDocument.hpp"

char const* cycleStateName(CycleState state) noexcept
{
    switch (state)
    {
        case CycleState::Idle:               return "Idle";
        case CycleState::BuildingStations:   return "BuildingStations";
        case CycleState::ResolvingLines:     return "ResolvingLines";
        case CycleState::CollectingVehicles: return "CollectingVehicles";
        case CycleState::Enriching:          return "Enriching";
        case CycleState::BuildingPaths:      return "BuildingPaths";
        case CycleState::RefreshingCaches:   return "RefreshingCaches";
        case CycleState::ComputingStats:     return "ComputingStats";
        case CycleState::Serializing:        return "Serializing";
        case CycleState::Written:            return "Written";
        case CycleState::FallbackWritten:    return "FallbackWritten";
    }
    return "Unknown";
}

SnapshotOrchestrator::SnapshotOrchestrator(HostApi& host, TelemetryConfig config, SnapshotArchive* archive)
    : settings(std::move(config))
    , accessor(host)
    , stations(accessor)
    , cacheManager(settings.trackRefreshCycles, settings.signalRefreshCycles)
    , archive(archive)
{
}

void SnapshotOrchestrator::setup()
{
    if (initialized)
    {
        std::cout << "[Telemetry] setup() already ran, ignoring\n";
        return;
    }

    initialized = true;
    callCounter = 0.0;
    lastWriteCall = 0.0;
    lastEventCall = 0.0;
    std::cout << "[Telemetry] Setup: " << settings.outputPath
              << " (interval: " << settings.writeInterval << "s)\n";
}

void SnapshotOrchestrator::onTick(double dt)
{
    if (!std::isfinite(dt) || dt < 0.0)
        return;

    callCounter += dt;
    if (callCounter - lastWriteCall >= settings.writeInterval)
    {
        lastWriteCall = callCounter;
        write();
    }
}

void SnapshotOrchestrator::onEvent()
{
    callCounter += EVENT_UNIT;
    if (callCounter - lastEventCall >= EVENT_UNIT)
    {
        lastEventCall = callCounter;
        write();
    }
}

void SnapshotOrchestrator::enter(CycleState next)
{
    current = next;
    trace.push_back(next);
}

StageResult<std::vector<Station>> SnapshotOrchestrator::buildStations()
{
    stations.build();
    return stations.stations();
}

StageResult<std::vector<Line>> SnapshotOrchestrator::resolveLines()
{
    if (!accessor.provides(HostCall::GetEntityList))
        return stageError("lines", "host cannot enumerate lines");

    std::vector<Line> lines = LineResolver::resolveLines(accessor, stations);
    if (!settings.includeBuses)
    {
        std::erase_if(lines, [](Line const& l) { return LineResolver::isRoadOrTram(l.vehicleType); });
    }
    return lines;
}

StageResult<std::vector<Vehicle>> SnapshotOrchestrator::collectVehicles()
{
    if (!accessor.provides(HostCall::GetEntityList))
        return stageError("vehicles", "host cannot enumerate vehicles");

    CollectorOptions options;
    options.includeCargo = settings.includeCargo;
    options.includeBuses = settings.includeBuses;
    return VehicleCollector::collect(accessor, options);
}

StageResult<std::vector<Vehicle>> SnapshotOrchestrator::enrichVehicles(std::vector<Vehicle> vehicles, std::vector<Line> const& lines)
{
    VehicleCollector::enrich(vehicles, lines);
    return vehicles;
}

StageResult<std::vector<Path>> SnapshotOrchestrator::buildPaths(std::vector<Line> const& lines)
{
    return PathBuilder::build(lines, stations, accessor);
}

StageResult<void> SnapshotOrchestrator::refreshCaches()
{
    cacheManager.update(accessor);
    return outcome::success();
}

Snapshot SnapshotOrchestrator::assemble()
{
    Snapshot snap;
    snap.writeCount = writes;

    enter(CycleState::BuildingStations);
    bool stationsBuilt = false;
    snap.stations = isolateStage<std::vector<Station>>("stations", [&] {
        StageResult<std::vector<Station>> result = buildStations();
        stationsBuilt = result.has_value();
        return result;
    });
    // Later stages must not resolve against a half-built alias map.
    if (!stationsBuilt)
        stations.clear();

    enter(CycleState::ResolvingLines);
    snap.lines = isolateStage<std::vector<Line>>("lines", [&] { return resolveLines(); });

    enter(CycleState::CollectingVehicles);
    snap.vehicles = isolateStage<std::vector<Vehicle>>("vehicles", [&] { return collectVehicles(); });

    enter(CycleState::Enriching);
    snap.vehicles = isolateStage<std::vector<Vehicle>>("enrich", [&] { return enrichVehicles(std::move(snap.vehicles), snap.lines); });

    enter(CycleState::BuildingPaths);
    snap.paths = isolateStage<std::vector<Path>>("paths", [&] { return buildPaths(snap.lines); });

    enter(CycleState::RefreshingCaches);
    isolateStage<void>("caches", [&] { return refreshCaches(); });
    snap.tracks = cacheManager.tracks();
    snap.signals = cacheManager.signals();

    enter(CycleState::ComputingStats);
    snap.stats = SnapshotDocument::buildStats(snap.vehicles, snap.lines.size(), snap.stations.size());
    if (std::optional<Value> gameTime = accessor.gameTime())
        snap.gameTime = std::move(*gameTime);

    return snap;
}

bool SnapshotOrchestrator::write()
{
    if (!initialized)
    {
        std::cerr << "[Telemetry] WARNING: setup() has not been called, skipping write\n";
        return false;
    }

    trace.clear();
    ++writes;

    bool written = false;
    bool failed = false;
    try
    {
        Snapshot snap = assemble();
        enter(CycleState::Serializing);
        written = publish(snap, false);
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Telemetry] Snapshot cycle failed in " << cycleStateName(current) << ": " << e.what() << "\n";
        failed = true;
    }

    // After the first cycle the accessor knows which type keys answered.
    if (!diagWritten)
    {
        writeDiagnostics();
        diagWritten = true;
    }

    if (!failed)
        return written;

    writeFallback();
    return current == CycleState::FallbackWritten;
}

void SnapshotOrchestrator::writeFallback()
{
    try
    {
        if (publish(SnapshotDocument::fallback(writes), true))
            return;
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Telemetry] Fallback document failed: " << e.what() << "\n";
    }
    current = CycleState::Idle;
}

bool SnapshotOrchestrator::publish(Snapshot const& snapshot, bool fallback)
{
    std::string payload = Serializer::encode(SnapshotDocument::toValue(snapshot));
    if (!writeDocument(payload))
        return false;

    enter(fallback ? CycleState::FallbackWritten : CycleState::Written);
    last = snapshot;
    lastDocument = payload;

    if (fallback)
    {
        std::cout << "[Telemetry] Snapshot #" << snapshot.writeCount << ": fallback document written\n";
    }
    else
    {
        std::cout << "[Telemetry] Snapshot #" << snapshot.writeCount << ": "
                  << snapshot.vehicles.size() << " vehicles, "
                  << snapshot.lines.size() << " lines, "
                  << snapshot.stations.size() << " stations, "
                  << snapshot.paths.size() << " paths, "
                  << snapshot.tracks.size() << " tracks, "
                  << snapshot.signals.size() << " signals\n";
    }

    if (archive)
        archive->record(snapshot, payload, fallback);
    return true;
}

bool SnapshotOrchestrator::writeDocument(std::string const& payload)
{
    std::filesystem::path target(settings.outputPath);
    std::filesystem::path tmp(settings.outputPath + ".tmp");

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            std::cerr << "[Telemetry] Cannot open output file: " << tmp << "\n";
            return false;
        }
        out << payload;
        if (!out.flush())
        {
            std::cerr << "[Telemetry] Write failed: " << tmp << "\n";
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec)
    {
        std::cerr << "[Telemetry] Rename to " << target << " failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

void SnapshotOrchestrator::writeDiagnostics()
{
    std::filesystem::path diagPath = std::filesystem::path(settings.outputPath).parent_path() / DIAG_FILE;
    std::ofstream out(diagPath, std::ios::trunc);
    if (!out.is_open())
    {
        std::cerr << "[Telemetry] Cannot write diagnostics: " << diagPath << "\n";
        return;
    }
    out << accessor.describe();
}
