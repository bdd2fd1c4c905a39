#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace auditgate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)) {
  db_->Exec(mode == Mode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    const int rc = db_->TryExec("ROLLBACK;");
    if (rc != SQLITE_OK) {
      AUDITGATE_LOG_WARN("sqlite rollback failed",
                         {observability::StringField("path", db_->Path()), observability::StringField("error", sqlite3_errstr(rc))});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

} // namespace auditgate::db::sqlite
