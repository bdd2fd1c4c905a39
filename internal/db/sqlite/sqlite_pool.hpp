#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace auditgate::db::sqlite {

/*
  SqliteReaderPool

  Fixed number of reader slots over one database file. Connections are
  opened read-only and query_only on first use of a slot; WAL lets each
  of them read the last committed snapshot while the writer appends.

  A borrowed connection goes back to its slot when the last copy of the
  returned shared_ptr is dropped. A connection handed back inside an open
  transaction is rolled back first; if that fails it is closed and the
  slot reopens on its next use.
*/
class SqliteReaderPool : public std::enable_shared_from_this<SqliteReaderPool> {
 public:
  SqliteReaderPool(std::string path, int busy_timeout_ms, std::size_t slots = 4);

  // Blocks while every slot is borrowed. Throws SqliteError if a slot cannot open.
  std::shared_ptr<SqliteDB> Acquire();

 private:
  struct Slot {
    std::unique_ptr<SqliteDB> conn;
    bool                      borrowed = false;
  };

  std::size_t ReserveSlot(std::unique_lock<std::mutex>& lock);
  void        Return(std::size_t index) noexcept;

  std::string path_;
  int         busy_timeout_ms_;

  std::mutex              mutex_;
  std::condition_variable slot_freed_;
  std::vector<Slot>       slots_;
};

} // namespace auditgate::db::sqlite
