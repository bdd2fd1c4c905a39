#include "sqlite_pool.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace auditgate::db::sqlite {

SqliteReaderPool::SqliteReaderPool(std::string path, int busy_timeout_ms, std::size_t slots)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms), slots_(slots == 0 ? 1 : slots) {
}

// Prefers a slot that already holds an open connection.
std::size_t SqliteReaderPool::ReserveSlot(std::unique_lock<std::mutex>& lock) {
  for (;;) {
    std::size_t unopened = slots_.size();
    for (std::size_t i = 0; i < slots_.size(); ++i) {
      if (slots_[i].borrowed) continue;
      if (slots_[i].conn) {
        slots_[i].borrowed = true;
        return i;
      }
      if (unopened == slots_.size()) unopened = i;
    }
    if (unopened != slots_.size()) {
      slots_[unopened].borrowed = true;
      return unopened;
    }
    slot_freed_.wait(lock);
  }
}

std::shared_ptr<SqliteDB> SqliteReaderPool::Acquire() {
  std::unique_lock lock(mutex_);
  const auto       index = ReserveSlot(lock);
  SqliteDB*        conn  = slots_[index].conn.get();

  if (!conn) {
    // the slot is reserved, so the open can run without the lock
    lock.unlock();
    std::unique_ptr<SqliteDB> opened;
    try {
      OpenOptions options;
      options.read_only       = true;
      options.busy_timeout_ms = busy_timeout_ms_;
      opened                  = std::make_unique<SqliteDB>(path_, options);
    } catch (const std::exception&) {
      Return(index);
      throw;
    }
    lock.lock();
    conn               = opened.get();
    slots_[index].conn = std::move(opened);
  }

  // the deleter keeps the pool alive while the connection is out
  return std::shared_ptr<SqliteDB>(conn, [self = shared_from_this(), index](SqliteDB*) { self->Return(index); });
}

void SqliteReaderPool::Return(std::size_t index) noexcept {
  {
    std::lock_guard lock(mutex_);
    auto&           slot = slots_[index];

    if (slot.conn && !sqlite3_get_autocommit(slot.conn->Handle())) {
      const int rc = slot.conn->TryExec("ROLLBACK;");
      if (rc != SQLITE_OK) {
        AUDITGATE_LOG_WARN("closing reader left inside a transaction",
                           {observability::StringField("path", path_), observability::StringField("error", sqlite3_errstr(rc))});
        slot.conn.reset();
      }
    }
    slot.borrowed = false;
  }
  slot_freed_.notify_one();
}

} // namespace auditgate::db::sqlite
