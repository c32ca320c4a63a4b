#include "Database.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <ctime>
#include <stdexcept>

namespace alib {

int64_t unix_now() { return static_cast<int64_t>(std::time(nullptr)); }

Database::Database(const std::string& dbPath) : path_(dbPath), db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open ledger " + dbPath + ": " + msg);
  }
  db_ = db;
  try {
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

Database::~Database() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void Database::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(db_), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

// -------- Statement --------

Statement::Statement(Database& db, const char* sql) : db_(db), st_(nullptr) {
  auto* h = static_cast<sqlite3*>(db.handle());
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(h, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error("prepare failed: " + std::string(sqlite3_errmsg(h)));
  }
  st_ = st;
}

Statement::~Statement() {
  sqlite3_finalize(static_cast<sqlite3_stmt*>(st_));
}

Statement& Statement::bindText(int idx, const std::string& v) {
  sqlite3_bind_text(static_cast<sqlite3_stmt*>(st_), idx, v.c_str(), -1, SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::bindInt64(int idx, int64_t v) {
  sqlite3_bind_int64(static_cast<sqlite3_stmt*>(st_), idx, v);
  return *this;
}

Statement& Statement::bindNull(int idx) {
  sqlite3_bind_null(static_cast<sqlite3_stmt*>(st_), idx);
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(static_cast<sqlite3_stmt*>(st_));
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error("step failed: " +
                           std::string(sqlite3_errmsg(static_cast<sqlite3*>(db_.handle()))));
}

void Statement::run() {
  if (step()) throw std::runtime_error("statement unexpectedly returned rows");
}

void Statement::reset() {
  auto* st = static_cast<sqlite3_stmt*>(st_);
  sqlite3_reset(st);
  sqlite3_clear_bindings(st);
}

std::string Statement::text(int col) const {
  const auto* p = sqlite3_column_text(static_cast<sqlite3_stmt*>(st_), col);
  return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
}

int64_t Statement::int64(int col) const {
  return sqlite3_column_int64(static_cast<sqlite3_stmt*>(st_), col);
}

bool Statement::isNull(int col) const {
  return sqlite3_column_type(static_cast<sqlite3_stmt*>(st_), col) == SQLITE_NULL;
}

// -------- WriteTransaction --------

WriteTransaction::WriteTransaction(Database& db) : db_(db), lock_(db.writeMutex()) {
  db_.exec("BEGIN IMMEDIATE;");
}

WriteTransaction::~WriteTransaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(db_.handle()), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("rollback failed on {}: {}", db_.path(), err ? err : "unknown error");
    sqlite3_free(err);
  }
}

void WriteTransaction::commit() {
  db_.exec("COMMIT;");
  done_ = true;
}

} // namespace alib
