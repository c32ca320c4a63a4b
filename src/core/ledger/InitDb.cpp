// src/core/ledger/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace alib {

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

static int userVersion(sqlite3* db) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error("Cannot read user_version: " + std::string(sqlite3_errmsg(db)));
    int v = 0;
    if (sqlite3_step(st) == SQLITE_ROW) v = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return v;
}

static bool hasColumn(sqlite3* db, const char* table, const char* column) {
    sqlite3_stmt* st = nullptr;
    const std::string sql = std::string("PRAGMA table_info(") + table + ");";
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error("Cannot read table_info: " + std::string(sqlite3_errmsg(db)));
    bool found = false;
    while (!found && sqlite3_step(st) == SQLITE_ROW) {
        const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(st, 1));
        found = name && std::string(name) == column;
    }
    sqlite3_finalize(st);
    return found;
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error("Failed to open ledger: " + msg);
    }

    try {
        // Pragmas: concurrency + durability + integrity
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=FULL;");
        execAll(db, "PRAGMA foreign_keys=ON;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        const int onDisk = userVersion(db);
        if (onDisk > kLedgerSchemaVersion) {
            throw std::runtime_error("Ledger format " + std::to_string(onDisk) +
                                     " is newer than supported format " +
                                     std::to_string(kLedgerSchemaVersion));
        }

        // Load schema file and apply (safe: CREATE TABLE IF NOT EXISTS ...)
        std::ifstream in(schemaPath);
        if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
        std::ostringstream buf; buf << in.rdbuf();
        execAll(db, buf.str());

        // Format 3: upload jobs remember that completion was requested.
        if (!hasColumn(db, "upload_jobs", "completion_requested_at"))
            execAll(db, "ALTER TABLE upload_jobs ADD COLUMN completion_requested_at INTEGER;");

        if (onDisk < kLedgerSchemaVersion) {
            execAll(db, "PRAGMA user_version=" + std::to_string(kLedgerSchemaVersion) + ";");
            spdlog::info("ledger {} upgraded from format {} to {}", dbPath, onDisk, kLedgerSchemaVersion);
        }

        sqlite3_close(db);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

} // namespace alib
