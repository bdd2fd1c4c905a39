#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace auditgate::service {

// Wraps one RPC body with a span, request metrics and an error log line.
// Exceptions are rethrown unchanged for the transport to map.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  auditgate::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    auditgate::observability::Metrics::Instance().RecordRequest(route, true);
    auditgate::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    AUDITGATE_LOG_ERROR("RPC failed", {auditgate::observability::StringField("route", route), auditgate::observability::StringField("error", ex.what())});
    auditgate::observability::Metrics::Instance().RecordRequest(route, false);
    auditgate::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace auditgate::service
