#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace auditgate::db::model {

struct OperationSummary {
  std::string operation_name;
  uint64_t count = 0;
  uint64_t error_count = 0;
  double error_rate = 0.0;
  double avg_duration_ms = 0.0;
  double max_duration_ms = 0.0;
};

/*
  Aggregate view over the whole log.

  error_rate is error_count / total_events, 0 when empty.
  per_operation is ordered by count desc, then operation_name asc.
*/
struct AuditSummary {
  uint64_t total_events = 0;
  uint64_t error_count = 0;
  double error_rate = 0.0;
  uint64_t unique_operations = 0;
  uint64_t unique_clients = 0;
  uint64_t unique_sessions = 0;
  double avg_duration_ms = 0.0;
  double max_duration_ms = 0.0;
  std::optional<int64_t> first_event_ms;
  std::optional<int64_t> last_event_ms;
  std::vector<OperationSummary> per_operation;
};

}
