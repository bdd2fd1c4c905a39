#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/model/audit_summary.hpp"
#include "internal/db/model/invocation_event.hpp"

namespace auditgate::db {

/*
  Scan predicates. Every set field must match (logical AND).
  Time bounds are inclusive, in unix milliseconds.
*/
struct EventFilter {
  std::optional<std::string> operation_name;
  std::optional<std::string> session_id;
  std::optional<std::string> client_name;
  std::optional<int64_t> since_ms;
  std::optional<int64_t> until_ms;
  bool errors_only = false;
};

// Cap applied when a scan does not name a limit.
inline constexpr std::size_t kMaxScanLimit = 1000;

// Shape checks every backend runs before persisting an event.
Result ValidateForAppend(const model::InvocationEvent& event);

/*
  Append-only invocation log.

  CRITICAL GUARANTEES:

  - Append assigns ids that are unique and strictly increasing in the
    order appends are accepted; concurrent appends never share an id
  - An appended event is durable and visible to readers once Append returns
  - Readers never observe a partial record
  - Events are never updated or deleted through this interface

  Scan returns the highest ids first.
*/
class EventStore {
 public:
  virtual ~EventStore() = default;

  // On success event.id holds the assigned id.
  virtual Result Append(model::InvocationEvent& event) = 0;

  // Throws util::StorageError on read failure.
  virtual std::vector<model::InvocationEvent> Scan(const EventFilter& filter, std::optional<std::size_t> limit) = 0;

  // Throws util::StorageError on read failure.
  virtual model::AuditSummary Aggregate() = 0;

  // Throws util::StorageError on read failure.
  virtual uint64_t Count() = 0;
};

} // namespace auditgate::db
