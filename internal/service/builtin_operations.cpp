#include "builtin_operations.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "auditgate/v1/audit_query_service.pb.h"
#include "internal/audit/query_engine.hpp"
#include "internal/gateway/dispatcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "proto_convert.hpp"

namespace auditgate::service {

namespace {

google::protobuf::Struct ParseArguments(const std::string& arguments_json) {
  google::protobuf::Struct arguments;
  if (arguments_json.empty()) {
    return arguments;
  }

  auto status = google::protobuf::util::JsonStringToMessage(arguments_json, &arguments);
  if (!status.ok()) {
    throw util::ValidationError("arguments", "expected a JSON object: " + std::string(status.message()));
  }
  return arguments;
}

// Scalars arrive typed from JSON; the query layer validates raw text.
std::optional<std::string> RawArgument(const google::protobuf::Struct& arguments, const std::string& key) {
  auto it = arguments.fields().find(key);
  if (it == arguments.fields().end()) {
    return std::nullopt;
  }

  const auto& value = it->second;
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
      return std::nullopt;
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return std::string(value.bool_value() ? "true" : "false");
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
      }
      return std::to_string(number);
    }
    default:
      throw util::ValidationError(key, "expected a scalar value");
  }
}

template <typename Message>
std::string ToJson(const Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  auto status                        = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize result: " + std::string(status.message()));
  }
  return json;
}

std::string EventsToJson(const std::vector<db::model::InvocationEvent>& events) {
  auditgate::v1::EventsResponse resp;
  for (const auto& event : events) {
    *resp.add_events() = ToProto(event);
  }
  return ToJson(resp);
}

} // namespace

void RegisterBuiltinOperations(gateway::Dispatcher& dispatcher, std::shared_ptr<audit::QueryEngine> query_engine) {
  dispatcher.Register(gateway::OperationSpec{
      "audit.recent", "Most recent invocation events, newest first", false, [query_engine](const std::string& arguments_json, const gateway::CallerContext&) {
        const auto arguments = ParseArguments(arguments_json);
        return EventsToJson(query_engine->Recent(RawArgument(arguments, "limit")));
      }});

  dispatcher.Register(gateway::OperationSpec{
      "audit.query", "Filtered invocation events, newest first", false, [query_engine](const std::string& arguments_json, const gateway::CallerContext&) {
        const auto         arguments = ParseArguments(arguments_json);
        audit::QueryParams params;
        params.operation_name = RawArgument(arguments, "operation_name");
        params.session_id     = RawArgument(arguments, "session_id");
        params.client_name    = RawArgument(arguments, "client_name");
        params.since          = RawArgument(arguments, "since");
        params.until          = RawArgument(arguments, "until");
        params.errors_only    = RawArgument(arguments, "errors_only");
        params.limit          = RawArgument(arguments, "limit");
        return EventsToJson(query_engine->Query(params));
      }});

  dispatcher.Register(gateway::OperationSpec{
      "audit.summary", "Aggregate statistics over the whole audit log", false, [query_engine](const std::string&, const gateway::CallerContext&) {
        return ToJson(ToProto(query_engine->Summary()));
      }});

  dispatcher.Register(gateway::OperationSpec{
      "gateway.ping", "Liveness check; fails when the audit store is unavailable", true,
      [query_engine](const std::string&, const gateway::CallerContext&) {
        const auto               events = query_engine->EventCount();
        google::protobuf::Struct result;
        (*result.mutable_fields())["status"].set_string_value("ok");
        (*result.mutable_fields())["audit_events"].set_number_value(static_cast<double>(events));
        (*result.mutable_fields())["time"].set_string_value(util::FormatIso8601(util::Now()));
        return ToJson(result);
      }});
}

} // namespace auditgate::service
