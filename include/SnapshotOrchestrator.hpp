#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "CacheManager.hpp"
#include "ConfigurationManager.hpp"
#include "EntityAccessor.hpp"
#include "HostApi.hpp"
#include "SnapshotArchive.hpp"
#include "StageResult.hpp"
#include "StationResolver.hpp"
#include "Types.hpp"
#include "VehicleCollector.hpp"

enum class CycleState
{
    Idle,
    BuildingStations,
    ResolvingLines,
    CollectingVehicles,
    Enriching,
    BuildingPaths,
    RefreshingCaches,
    ComputingStats,
    Serializing,
    Written,
    FallbackWritten
};

char const* cycleStateName(CycleState state) noexcept;

// Owns everything that lives across cycles (accessor probe results, station
// aliases, track and signal caches) and runs one snapshot cycle at a time.
// Every cycle ends with a complete document on disk.
class SnapshotOrchestrator
{
public:
    static constexpr double EVENT_UNIT = 1.0;
    static inline const std::string DIAG_FILE = "telemetry_diag.txt";

    SnapshotOrchestrator(HostApi& host, TelemetryConfig config, SnapshotArchive* archive = nullptr);
    virtual ~SnapshotOrchestrator() = default;

    // Safe to call from several lifecycle hooks; only the first call counts.
    void setup();
    [[nodiscard]] bool isSetUp() const noexcept { return initialized; }

    // Host tick with the elapsed simulation time.
    void onTick(double dt);
    // Discrete host event; at most one write per EVENT_UNIT.
    void onEvent();

    // Runs one full cycle. Returns false only when nothing could be written.
    bool write();

    [[nodiscard]] CycleState state() const noexcept { return current; }
    [[nodiscard]] std::vector<CycleState> const& lastCycleTrace() const noexcept { return trace; }
    [[nodiscard]] std::int64_t writeCount() const noexcept { return writes; }
    [[nodiscard]] Snapshot const& lastSnapshot() const noexcept { return last; }
    [[nodiscard]] std::string const& lastPayload() const noexcept { return lastDocument; }
    [[nodiscard]] TelemetryConfig const& config() const noexcept { return settings; }

    CacheManager& caches() noexcept { return cacheManager; }
    EntityAccessor& entityAccessor() noexcept { return accessor; }
    StationResolver& stationResolver() noexcept { return stations; }

protected:
    // Pipeline stages; each runs behind its own failure boundary.
    virtual StageResult<std::vector<Station>> buildStations();
    virtual StageResult<std::vector<Line>> resolveLines();
    virtual StageResult<std::vector<Vehicle>> collectVehicles();
    virtual StageResult<std::vector<Vehicle>> enrichVehicles(std::vector<Vehicle> vehicles, std::vector<Line> const& lines);
    virtual StageResult<std::vector<Path>> buildPaths(std::vector<Line> const& lines);
    virtual StageResult<void> refreshCaches();

    // All stages in order. An exception leaving here triggers the fallback document.
    virtual Snapshot assemble();

    void enter(CycleState next);

private:
    TelemetryConfig settings;
    EntityAccessor accessor;
    StationResolver stations;
    CacheManager cacheManager;
    SnapshotArchive* archive;

    bool initialized = false;
    bool diagWritten = false;
    std::int64_t writes = 0;
    double callCounter = 0.0;
    double lastWriteCall = 0.0;
    double lastEventCall = 0.0;

    CycleState current = CycleState::Idle;
    std::vector<CycleState> trace;
    Snapshot last;
    std::string lastDocument;

    bool publish(Snapshot const& snapshot, bool fallback);
    bool writeDocument(std::string const& payload);
    void writeDiagnostics();
    void writeFallback();
};
