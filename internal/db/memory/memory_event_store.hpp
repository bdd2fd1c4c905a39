#pragma once

#include <shared_mutex>
#include <vector>

#include "internal/db/api/event_store.hpp"

namespace auditgate::db::memory {

/*
  Process-local invocation log.

  Appends take the exclusive lock; scans and aggregates share it.
  Nothing survives the process.
*/
class MemoryEventStore final : public db::EventStore {
public:
  MemoryEventStore();

  Result Append(model::InvocationEvent& event) override;
  std::vector<model::InvocationEvent> Scan(const EventFilter& filter, std::optional<std::size_t> limit) override;
  model::AuditSummary Aggregate() override;
  uint64_t Count() override;

private:
  std::shared_mutex mutex_;
  std::vector<model::InvocationEvent> events_; // ascending id
  uint64_t last_id_ = 0;
};

}
