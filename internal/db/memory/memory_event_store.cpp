#include "memory_event_store.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace auditgate::db::memory {

namespace {

bool Matches(const EventFilter& f, const model::InvocationEvent& e) {
  if (f.operation_name && e.operation_name != *f.operation_name) return false;
  if (f.session_id && e.session_id != f.session_id) return false;
  if (f.client_name && e.client_name != f.client_name) return false;
  if (f.since_ms && e.timestamp_ms < *f.since_ms) return false;
  if (f.until_ms && e.timestamp_ms > *f.until_ms) return false;
  if (f.errors_only && e.status != model::InvocationStatus::kError) return false;
  return true;
}

struct OperationTotals {
  uint64_t count       = 0;
  uint64_t errors      = 0;
  double   duration_ms = 0.0;
  double   max_ms      = 0.0;
};

} // namespace

MemoryEventStore::MemoryEventStore() = default;

Result MemoryEventStore::Append(model::InvocationEvent& event) {
  if (auto valid = ValidateForAppend(event); !valid) return valid;

  std::unique_lock lock(mutex_);
  event.id = ++last_id_;
  events_.push_back(event);
  return Result::Ok();
}

std::vector<model::InvocationEvent> MemoryEventStore::Scan(const EventFilter& filter, std::optional<std::size_t> limit) {
  const auto capped = std::min(limit.value_or(kMaxScanLimit), kMaxScanLimit);

  std::shared_lock lock(mutex_);
  std::vector<model::InvocationEvent> out;
  for (auto it = events_.rbegin(); it != events_.rend() && out.size() < capped; ++it) {
    if (Matches(filter, *it)) out.push_back(*it);
  }
  return out;
}

model::AuditSummary MemoryEventStore::Aggregate() {
  std::shared_lock lock(mutex_);

  model::AuditSummary summary;
  std::map<std::string, OperationTotals> per_op;
  std::set<std::string> clients;
  std::set<std::string> sessions;
  double total_duration = 0.0;

  for (const auto& e : events_) {
    ++summary.total_events;
    const bool is_error = e.status == model::InvocationStatus::kError;
    if (is_error) ++summary.error_count;

    total_duration += e.duration_ms;
    summary.max_duration_ms = std::max(summary.max_duration_ms, e.duration_ms);

    if (!summary.first_event_ms || e.timestamp_ms < *summary.first_event_ms) summary.first_event_ms = e.timestamp_ms;
    if (!summary.last_event_ms || e.timestamp_ms > *summary.last_event_ms) summary.last_event_ms = e.timestamp_ms;

    if (e.client_name) clients.insert(*e.client_name);
    if (e.session_id) sessions.insert(*e.session_id);

    auto& totals = per_op[e.operation_name];
    ++totals.count;
    if (is_error) ++totals.errors;
    totals.duration_ms += e.duration_ms;
    totals.max_ms = std::max(totals.max_ms, e.duration_ms);
  }

  summary.unique_operations = per_op.size();
  summary.unique_clients    = clients.size();
  summary.unique_sessions   = sessions.size();
  if (summary.total_events > 0) {
    summary.avg_duration_ms = total_duration / static_cast<double>(summary.total_events);
    summary.error_rate      = static_cast<double>(summary.error_count) / static_cast<double>(summary.total_events);
  }

  for (const auto& [name, totals] : per_op) {
    model::OperationSummary op;
    op.operation_name  = name;
    op.count           = totals.count;
    op.error_count     = totals.errors;
    op.error_rate      = static_cast<double>(totals.errors) / static_cast<double>(totals.count);
    op.avg_duration_ms = totals.duration_ms / static_cast<double>(totals.count);
    op.max_duration_ms = totals.max_ms;
    summary.per_operation.push_back(std::move(op));
  }

  // std::map already yields name order; stable sort keeps it as the tie-break
  std::stable_sort(summary.per_operation.begin(), summary.per_operation.end(),
                   [](const model::OperationSummary& a, const model::OperationSummary& b) { return a.count > b.count; });

  return summary;
}

uint64_t MemoryEventStore::Count() {
  std::shared_lock lock(mutex_);
  return events_.size();
}

} // namespace auditgate::db::memory
