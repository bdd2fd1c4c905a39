#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace auditgate::db::sqlite {

/*
  SQLite transaction wrapper.

  kImmediate (writes) uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  kDeferred (reads) pins one WAL snapshot for several statements.

  Destructor rolls back if not committed.
*/
class SqliteTransaction {
public:
  enum class Mode {
    kDeferred,
    kImmediate,
  };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kImmediate);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit();

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
