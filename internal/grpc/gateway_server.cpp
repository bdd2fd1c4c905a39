#include "gateway_server.hpp"

#include "grpc_error.hpp"
#include "internal/util/uuid.hpp"

#include <string>

namespace auditgate::grpc {

using namespace auditgate::v1;

GatewayServer::GatewayServer(std::shared_ptr<auditgate::service::GatewayService> svc) : service_(std::move(svc)) {
}

::grpc::Status GatewayServer::Invoke(::grpc::ServerContext* context, const InvokeRequest* req, InvokeResponse* resp) {
  try {
    // Fall back to the transport's request id header, then to a fresh id.
    if (!req->caller().has_request_id()) {
      InvokeRequest copy = *req;
      std::string   request_id;
      if (context) {
        const auto& metadata = context->client_metadata();
        auto        it       = metadata.find("x-request-id");
        if (it != metadata.end()) request_id.assign(it->second.data(), it->second.size());
      }
      if (request_id.empty()) request_id = util::GenerateRequestId();
      copy.mutable_caller()->set_request_id(request_id);
      *resp = service_->Invoke(copy);
      return ::grpc::Status::OK;
    }

    *resp = service_->Invoke(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::ListOperations(::grpc::ServerContext*, const ListOperationsRequest* req, ListOperationsResponse* resp) {
  try {
    *resp = service_->ListOperations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace auditgate::grpc
