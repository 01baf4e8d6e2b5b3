#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "sqlite3.h"
#include "Types.hpp"

struct ArchiveEntry
{
    std::int64_t writeCount = 0;
    std::int64_t writtenAt = 0;     // unix seconds
    bool fallback = false;
    std::int64_t totalVehicles = 0;
    std::int64_t totalLines = 0;
    std::int64_t totalStations = 0;
    std::string payload;
};

// History of written documents, one row per cycle.
class SnapshotArchive
{
private:
    sqlite3* db;
    sqlite3_stmt* insertStmt;

public:
    static constexpr int PRUNE_EVERY = 100;
    static constexpr int KEEP_LATEST = 1000;

    explicit SnapshotArchive(std::string const& path);
    ~SnapshotArchive();

    SnapshotArchive(SnapshotArchive const&) = delete;
    SnapshotArchive& operator=(SnapshotArchive const&) = delete;

    [[nodiscard]] bool isOpen() const noexcept { return db != nullptr && insertStmt != nullptr; }

    void record(Snapshot const& snapshot, std::string const& payload, bool fallback);
    void insert(ArchiveEntry const& entry);
    void pruneKeepLatest(int keep);

    std::int64_t count();
    std::vector<ArchiveEntry> latest(int limit);
};
