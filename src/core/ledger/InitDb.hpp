#pragma once
#include <string>

namespace alib {

// Ledger file format version, stored in PRAGMA user_version.
constexpr int kLedgerSchemaVersion = 3;

// Creates or upgrades the ledger at dbPath from schemaPath. Idempotent.
// Throws if the file was written by a newer ledger format.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace alib
