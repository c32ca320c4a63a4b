#pragma once
#include <cstdint>
#include <mutex>
#include <string>

namespace alib {

// One SQLite connection to the ledger file. Writers serialize on
// writeMutex(); readers go straight to the connection (WAL).
class Database {
public:
  explicit Database(const std::string& dbPath);
  ~Database();
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  void exec(const std::string& sql);
  std::mutex& writeMutex() { return write_mu_; }
  const std::string& path() const { return path_; }
  void* handle() { return db_; } // sqlite3*

private:
  std::string path_;
  void* db_; // sqlite3*
  std::mutex write_mu_;
};

class Statement {
public:
  Statement(Database& db, const char* sql);
  ~Statement();
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bindText(int idx, const std::string& v);
  Statement& bindInt64(int idx, int64_t v);
  Statement& bindNull(int idx);

  // true while a row is available, false once done.
  bool step();
  // Executes a statement that returns no rows.
  void run();
  void reset();

  std::string text(int col) const;
  int64_t int64(int col) const;
  bool isNull(int col) const;

private:
  Database& db_;
  void* st_; // sqlite3_stmt*
};

// Exclusive write transaction (BEGIN IMMEDIATE). Rolls back unless commit()
// was reached.
class WriteTransaction {
public:
  explicit WriteTransaction(Database& db);
  ~WriteTransaction();
  WriteTransaction(const WriteTransaction&) = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  void commit();

private:
  Database& db_;
  std::unique_lock<std::mutex> lock_;
  bool done_ = false;
};

int64_t unix_now();

} // namespace alib
