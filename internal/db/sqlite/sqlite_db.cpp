#include "sqlite_db.hpp"

namespace auditgate::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, OpenOptions options) : path_(std::move(path)), options_(options) {
  const int flags = (options_.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) | SQLITE_OPEN_FULLMUTEX;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc, msg);
  }
}

int SqliteDB::TryExec(const std::string& sql) noexcept {
  return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  if (options_.read_only) {
    // refuse writes even if the file was opened through a writable path
    Exec("PRAGMA query_only=1;");
    return;
  }

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // FULL syncs the WAL on every commit; NORMAL may lose the tail on power loss
  Exec(options_.synchronous == Synchronous::kFull ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& s) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, s.c_str(), -1, SQLITE_TRANSIENT), db_, "sqlite bind");
}

void Statement::BindOptionalText(int idx, const std::optional<std::string>& s) {
  if (!s.has_value()) {
    ThrowIf(sqlite3_bind_null(stmt_, idx), db_, "sqlite bind");
    return;
  }
  BindText(idx, *s);
}

void Statement::BindInt64(int idx, int64_t v) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)), db_, "sqlite bind");
}

void Statement::BindDouble(int idx, double v) {
  ThrowIf(sqlite3_bind_double(stmt_, idx, v), db_, "sqlite bind");
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

} // namespace auditgate::db::sqlite
