#include "gateway_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <string>

#include "internal/gateway/dispatcher.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace auditgate::service {

using namespace auditgate::v1;

namespace {

gateway::CallerContext ToCaller(const CallerContext& caller) {
  gateway::CallerContext out;
  if (caller.has_session_id()) out.session_id = caller.session_id();
  if (caller.has_client_name()) out.client_name = caller.client_name();
  if (caller.has_client_version()) out.client_version = caller.client_version();
  if (caller.has_request_id()) out.request_id = caller.request_id();
  return out;
}

} // namespace

GatewayService::GatewayService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

InvokeResponse GatewayService::Invoke(const InvokeRequest& req) {
  return ObserveRpc("GatewayService.Invoke", [&] {
    if (req.operation().empty()) {
      throw util::ValidationError("operation", "must not be empty");
    }

    std::string arguments_json = "{}";
    if (req.has_arguments()) {
      arguments_json.clear();
      auto status = google::protobuf::util::MessageToJsonString(req.arguments(), &arguments_json);
      if (!status.ok()) {
        throw util::ValidationError("arguments", std::string(status.message()));
      }
    }

    InvokeResponse resp;
    resp.set_result_json(ctx_.dispatcher->Invoke(req.operation(), arguments_json, ToCaller(req.caller())));
    return resp;
  });
}

ListOperationsResponse GatewayService::ListOperations(const ListOperationsRequest&) {
  return ObserveRpc("GatewayService.ListOperations", [&] {
    ListOperationsResponse resp;
    for (const auto& op : ctx_.dispatcher->ListOperations()) {
      auto* out = resp.add_operations();
      out->set_name(op.name);
      out->set_description(op.description);
      out->set_audited(op.audited);
    }
    return resp;
  });
}

} // namespace auditgate::service
