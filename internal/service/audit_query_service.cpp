#include "audit_query_service.hpp"

#include <optional>
#include <string>
#include <vector>

#include "internal/audit/query_engine.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace auditgate::service {

using namespace auditgate::v1;

namespace {

std::optional<std::string> Field(bool present, const std::string& value) {
  if (!present) {
    return std::nullopt;
  }
  return value;
}

EventsResponse ToResponse(const std::vector<db::model::InvocationEvent>& events) {
  EventsResponse resp;
  resp.mutable_events()->Reserve(static_cast<int>(events.size()));
  for (const auto& event : events) {
    *resp.add_events() = ToProto(event);
  }
  return resp;
}

} // namespace

AuditQueryService::AuditQueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EventsResponse AuditQueryService::Recent(const RecentRequest& req) {
  return ObserveRpc("AuditQueryService.Recent", [&] {
    return ToResponse(ctx_.query_engine->Recent(Field(req.has_limit(), req.limit())));
  });
}

EventsResponse AuditQueryService::Query(const QueryRequest& req) {
  return ObserveRpc("AuditQueryService.Query", [&] {
    audit::QueryParams params;
    params.operation_name = Field(req.has_operation_name(), req.operation_name());
    params.session_id     = Field(req.has_session_id(), req.session_id());
    params.client_name    = Field(req.has_client_name(), req.client_name());
    params.since          = Field(req.has_since(), req.since());
    params.until          = Field(req.has_until(), req.until());
    params.errors_only    = Field(req.has_errors_only(), req.errors_only());
    params.limit          = Field(req.has_limit(), req.limit());
    return ToResponse(ctx_.query_engine->Query(params));
  });
}

SummaryResponse AuditQueryService::Summary(const SummaryRequest&) {
  return ObserveRpc("AuditQueryService.Summary", [&] {
    SummaryResponse resp;
    *resp.mutable_summary() = ToProto(ctx_.query_engine->Summary());
    return resp;
  });
}

} // namespace auditgate::service
