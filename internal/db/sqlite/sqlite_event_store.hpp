#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/event_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_pool.hpp"

namespace auditgate::db::sqlite {

struct SqliteStoreOptions {
  std::string path;
  Synchronous synchronous      = Synchronous::kFull;
  int         busy_timeout_ms  = 5000;
  std::size_t reader_pool_size = 4;
};

/*
  SQLite-backed invocation log.

  One writer connection, serialized by write_mutex_, appends inside
  BEGIN IMMEDIATE. Reads borrow read-only connections from the pool and
  see the last committed WAL snapshot, so they never wait on the writer.
*/
class SqliteEventStore final : public db::EventStore {
public:
  SqliteEventStore(std::shared_ptr<SqliteDB> writer, std::shared_ptr<SqliteReaderPool> readers);

  Result Append(model::InvocationEvent& event) override;
  std::vector<model::InvocationEvent> Scan(const EventFilter& filter, std::optional<std::size_t> limit) override;
  model::AuditSummary Aggregate() override;
  uint64_t Count() override;

private:
  std::shared_ptr<SqliteDB> writer_;
  std::shared_ptr<SqliteReaderPool> readers_;
  std::mutex write_mutex_;

  static Result Translate(int rc, const std::string& message);
};

// Creates the schema if absent (idempotent). Throws on failure.
void BootstrapSqliteSchema(SqliteDB& db);

/*
  Opens the file, selects durability mode, runs the schema bootstrap and
  builds the reader pool. Throws on failure; the caller decides whether to
  retry.
*/
std::shared_ptr<SqliteEventStore> OpenSqliteEventStore(const SqliteStoreOptions& options);

}
