#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace auditgate::db::model {

enum class InvocationStatus {
  kSuccess = 0,
  kError   = 1,
};

/*
  One immutable audit record.

  id is assigned by the store on append (1-based, strictly increasing).
  error_detail is set iff status == kError.
*/
struct InvocationEvent {
  uint64_t id           = 0;
  int64_t  timestamp_ms = 0;
  std::string operation_name;
  std::optional<std::string> session_id;
  std::optional<std::string> client_name;
  std::optional<std::string> client_version;
  std::optional<std::string> request_id;
  std::optional<std::string> arguments;
  InvocationStatus status = InvocationStatus::kSuccess;
  std::optional<std::string> error_detail;
  double duration_ms = 0.0;
};

}
