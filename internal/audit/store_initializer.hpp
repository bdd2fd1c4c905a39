#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "internal/db/api/event_store.hpp"

namespace auditgate::audit {

using StoreFactory = std::function<std::shared_ptr<db::EventStore>()>;

/*
  Lazily creates the event store on first use.

  Whichever caller arrives first (a write, a scan or an aggregate) runs the
  factory; concurrent callers wait for it and then share the same handle.
  A failed factory leaves the initializer un-ready so the next call retries.
*/
class StoreInitializer {
 public:
  explicit StoreInitializer(StoreFactory factory);

  // Throws util::InitializationError if the store cannot be created.
  std::shared_ptr<db::EventStore> EnsureReady();

  bool IsReady() const noexcept;

  // Drops the handle; the next EnsureReady() recreates the store.
  void Reset();

 private:
  std::shared_ptr<db::EventStore> LoadHandle() const;

  StoreFactory factory_;

  // init_mutex_ serializes factory runs and resets; handle_mutex_ guards store_.
  std::mutex                      init_mutex_;
  mutable std::shared_mutex       handle_mutex_;
  std::shared_ptr<db::EventStore> store_;
  std::atomic<bool>               ready_{false};
};

} // namespace auditgate::audit
