#include "event_store.hpp"

namespace auditgate::db {

Result ValidateForAppend(const model::InvocationEvent& event) {
  if (event.operation_name.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "operation_name must not be empty");
  }
  if (!(event.duration_ms >= 0.0)) {
    return Result::Err(ErrorCode::InvalidArgument, "duration_ms must be non-negative");
  }
  if (event.status == model::InvocationStatus::kSuccess && event.error_detail.has_value()) {
    return Result::Err(ErrorCode::InvalidArgument, "successful event must not carry error_detail");
  }
  if (event.status == model::InvocationStatus::kError && (!event.error_detail.has_value() || event.error_detail->empty())) {
    return Result::Err(ErrorCode::InvalidArgument, "error event requires a non-empty error_detail");
  }
  return Result::Ok();
}

} // namespace auditgate::db
