#include "proto_convert.hpp"

#include "internal/util/time.hpp"

namespace auditgate::service {

auditgate::v1::InvocationEvent ToProto(const db::model::InvocationEvent& event) {
  auditgate::v1::InvocationEvent out;
  out.set_id(event.id);
  out.set_timestamp(util::FormatIso8601(util::FromUnixMillis(event.timestamp_ms)));
  out.set_operation_name(event.operation_name);
  if (event.session_id) out.set_session_id(*event.session_id);
  if (event.client_name) out.set_client_name(*event.client_name);
  if (event.client_version) out.set_client_version(*event.client_version);
  if (event.request_id) out.set_request_id(*event.request_id);
  if (event.arguments) out.set_arguments(*event.arguments);
  out.set_status(event.status == db::model::InvocationStatus::kError ? auditgate::v1::INVOCATION_STATUS_ERROR
                                                                      : auditgate::v1::INVOCATION_STATUS_SUCCESS);
  if (event.error_detail) out.set_error_detail(*event.error_detail);
  out.set_duration_ms(event.duration_ms);
  return out;
}

auditgate::v1::AuditSummary ToProto(const db::model::AuditSummary& summary) {
  auditgate::v1::AuditSummary out;
  out.set_total_events(summary.total_events);
  out.set_error_count(summary.error_count);
  out.set_error_rate(summary.error_rate);
  out.set_unique_operations(summary.unique_operations);
  out.set_unique_clients(summary.unique_clients);
  out.set_unique_sessions(summary.unique_sessions);
  out.set_avg_duration_ms(summary.avg_duration_ms);
  out.set_max_duration_ms(summary.max_duration_ms);
  if (summary.first_event_ms) out.set_first_event(util::FormatIso8601(util::FromUnixMillis(*summary.first_event_ms)));
  if (summary.last_event_ms) out.set_last_event(util::FormatIso8601(util::FromUnixMillis(*summary.last_event_ms)));

  for (const auto& op : summary.per_operation) {
    auto* entry = out.add_per_operation();
    entry->set_operation_name(op.operation_name);
    entry->set_count(op.count);
    entry->set_error_count(op.error_count);
    entry->set_error_rate(op.error_rate);
    entry->set_avg_duration_ms(op.avg_duration_ms);
    entry->set_max_duration_ms(op.max_duration_ms);
  }
  return out;
}

} // namespace auditgate::service
