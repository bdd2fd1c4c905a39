#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace auditgate::db::sqlite {

// sqlite failure carrying the primary result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

enum class Synchronous {
  kNormal,
  kFull,
};

struct OpenOptions {
  bool        read_only       = false;
  Synchronous synchronous     = Synchronous::kFull;
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Writer connections select WAL + the configured synchronous level.
  Read-only connections only get the busy timeout; they never change
  the journal mode.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, OpenOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations). Throws SqliteError.
  void Exec(const std::string& sql);

  // Non-throwing variant; returns the sqlite result code.
  int TryExec(const std::string& sql) noexcept;

  // Configure recommended PRAGMAs (WAL, synchronous, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenOptions options_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  void BindText(int idx, const std::string& s);
  void BindOptionalText(int idx, const std::optional<std::string>& s);
  void BindInt64(int idx, int64_t v);
  void BindDouble(int idx, double v);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace auditgate::db::sqlite
