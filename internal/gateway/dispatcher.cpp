#include "dispatcher.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace auditgate::gateway {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<audit::Recorder> recorder) : recorder_(std::move(recorder)) {
}

void Dispatcher::Register(OperationSpec spec) {
  if (spec.name.empty()) {
    throw std::invalid_argument("operation name must not be empty");
  }
  if (!spec.handler) {
    throw std::invalid_argument("operation '" + spec.name + "' has no handler");
  }

  std::unique_lock lock(mutex_);
  if (operations_.contains(spec.name)) {
    throw util::AlreadyExists("operation already registered: " + spec.name);
  }
  auto name = spec.name;
  operations_.emplace(std::move(name), std::move(spec));
}

std::string Dispatcher::Invoke(const std::string& name, const std::string& arguments_json, const CallerContext& caller) {
  const auto               start = std::chrono::steady_clock::now();
  observability::SpanScope span("gateway.dispatch");
  span.SetAttribute("auditgate.operation", name);

  audit::InvocationRecord record;
  record.operation_name = name;
  record.caller         = caller;
  record.arguments      = arguments_json;

  OperationHandler handler;
  bool             audited = true;
  {
    std::shared_lock lock(mutex_);
    auto             it = operations_.find(name);
    if (it != operations_.end()) {
      handler = it->second.handler;
      audited = it->second.audited;
    }
  }

  span.SetAttribute("auditgate.audited", static_cast<std::int64_t>(audited));

  if (!handler) {
    util::NotFound error("unknown operation: " + name);
    span.RecordException(error.what());
    record.outcome     = audit::Outcome::Failure(error.what());
    record.duration_ms = ElapsedMs(start);
    recorder_->Record(std::move(record));
    throw error;
  }

  auto finish = [&](audit::Outcome outcome) {
    const double duration_ms = ElapsedMs(start);
    span.SetAttribute("auditgate.duration_ms", duration_ms);
    if (!outcome.ok) span.RecordException(outcome.error_message);
    if (!audited) return;
    record.outcome     = std::move(outcome);
    record.duration_ms = duration_ms;
    recorder_->Record(std::move(record));
  };

  try {
    auto result = handler(arguments_json, caller);
    finish(audit::Outcome::Success());
    return result;
  } catch (const std::exception& e) {
    finish(audit::Outcome::Failure(e.what()));
    AUDITGATE_LOG_DEBUG("operation failed", {observability::StringField("operation", name), observability::StringField("error", e.what())});
    throw;
  } catch (...) {
    // Non-standard exception types still terminate the invocation.
    finish(audit::Outcome::Failure("unknown error"));
    AUDITGATE_LOG_DEBUG("operation failed", {observability::StringField("operation", name), observability::StringField("error", "unknown error")});
    throw;
  }
}

std::vector<OperationDescriptor> Dispatcher::ListOperations() const {
  std::shared_lock lock(mutex_);

  std::vector<OperationDescriptor> out;
  out.reserve(operations_.size());
  for (const auto& [name, spec] : operations_) {
    out.push_back(OperationDescriptor{name, spec.description, spec.audited});
  }
  return out;
}

} // namespace auditgate::gateway
