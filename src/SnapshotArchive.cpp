#include <ctime>
#include <iostream>
#include "SnapshotArchive.hpp"

SnapshotArchive::SnapshotArchive(std::string const& path)
    : db(nullptr), insertStmt(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Archive] Failed to open SQLite DB: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        db = nullptr;
        return;
    }

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS Snapshots ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  writeCount INTEGER, "
        "  writtenAt INTEGER, "
        "  fallback INTEGER, "
        "  totalVehicles INTEGER, "
        "  totalLines INTEGER, "
        "  totalStations INTEGER, "
        "  payload TEXT"
        ");";

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, createSql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Archive] Failed to create tables: "
                  << (errMsg ? errMsg : "unknown error") << "\n";
        if (errMsg) sqlite3_free(errMsg);
    }

    const char* insertSql =
        "INSERT INTO Snapshots "
        "(writeCount, writtenAt, fallback, totalVehicles, totalLines, totalStations, payload) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);";

    rc = sqlite3_prepare_v2(db, insertSql, -1, &insertStmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Archive] Failed to prepare insert statement: "
                  << sqlite3_errmsg(db) << "\n";
        insertStmt = nullptr;
    }
}

SnapshotArchive::~SnapshotArchive()
{
    if (insertStmt) sqlite3_finalize(insertStmt);
    if (db) sqlite3_close(db);
}

void SnapshotArchive::record(Snapshot const& snapshot, std::string const& payload, bool fallback)
{
    ArchiveEntry entry;
    entry.writeCount = snapshot.writeCount;
    entry.writtenAt = static_cast<std::int64_t>(std::time(nullptr));
    entry.fallback = fallback;
    entry.totalVehicles = snapshot.stats.totalVehicles;
    entry.totalLines = snapshot.stats.totalLines;
    entry.totalStations = snapshot.stats.totalStations;
    entry.payload = payload;
    insert(entry);

    if (snapshot.writeCount > 0 && snapshot.writeCount % PRUNE_EVERY == 0)
        pruneKeepLatest(KEEP_LATEST);
}

void SnapshotArchive::insert(ArchiveEntry const& e)
{
    if (!insertStmt)
        return;

    sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    sqlite3_reset(insertStmt);
    sqlite3_bind_int64(insertStmt, 1, static_cast<sqlite3_int64>(e.writeCount));
    sqlite3_bind_int64(insertStmt, 2, static_cast<sqlite3_int64>(e.writtenAt));
    sqlite3_bind_int(insertStmt, 3, e.fallback ? 1 : 0);
    sqlite3_bind_int64(insertStmt, 4, static_cast<sqlite3_int64>(e.totalVehicles));
    sqlite3_bind_int64(insertStmt, 5, static_cast<sqlite3_int64>(e.totalLines));
    sqlite3_bind_int64(insertStmt, 6, static_cast<sqlite3_int64>(e.totalStations));
    sqlite3_bind_text(insertStmt, 7, e.payload.c_str(), static_cast<int>(e.payload.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(insertStmt);
    if (rc != SQLITE_DONE)
    {
        std::cerr << "[Archive] SQLite insert failed: " << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
}

void SnapshotArchive::pruneKeepLatest(int keep)
{
    if (!db)
        return;

    const char* deleteSql =
        "DELETE FROM Snapshots WHERE id NOT IN "
        "(SELECT id FROM Snapshots ORDER BY id DESC LIMIT ?);";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, deleteSql, -1, &stmt, nullptr) == SQLITE_OK)
    {
        sqlite3_bind_int(stmt, 1, keep);
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE)
        {
            std::cerr << "[Archive] Prune delete failed: "
                      << sqlite3_errmsg(db) << "\n";
        }
        sqlite3_finalize(stmt);
    }
    else
    {
        std::cerr << "[Archive] Failed to prepare deleteSql: "
                  << sqlite3_errmsg(db) << "\n";
    }
}

std::int64_t SnapshotArchive::count()
{
    if (!db)
        return 0;

    std::int64_t result = 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT count(*) FROM Snapshots;", -1, &stmt, nullptr) == SQLITE_OK)
    {
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<ArchiveEntry> SnapshotArchive::latest(int limit)
{
    std::vector<ArchiveEntry> results;
    if (!db)
        return results;

    const char* sql =
        "SELECT writeCount, writtenAt, fallback, totalVehicles, totalLines, totalStations, payload "
        "FROM Snapshots ORDER BY id DESC LIMIT ?;";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Archive] Failed to prepare latest: "
                  << sqlite3_errmsg(db) << "\n";
        return results;
    }

    sqlite3_bind_int(stmt, 1, limit);
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        ArchiveEntry e;
        e.writeCount    = sqlite3_column_int64(stmt, 0);
        e.writtenAt     = sqlite3_column_int64(stmt, 1);
        e.fallback      = sqlite3_column_int(stmt, 2) != 0;
        e.totalVehicles = sqlite3_column_int64(stmt, 3);
        e.totalLines    = sqlite3_column_int64(stmt, 4);
        e.totalStations = sqlite3_column_int64(stmt, 5);

        const unsigned char* payload = sqlite3_column_text(stmt, 6);
        e.payload = payload ? reinterpret_cast<const char*>(payload) : "";

        results.push_back(std::move(e));
    }

    if (rc != SQLITE_DONE)
    {
        std::cerr << "[Archive] Error stepping latest: "
                  << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_finalize(stmt);
    return results;
}
