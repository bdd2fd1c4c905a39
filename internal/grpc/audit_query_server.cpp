#include "audit_query_server.hpp"

#include "grpc_error.hpp"

namespace auditgate::grpc {

using namespace auditgate::v1;

AuditQueryServer::AuditQueryServer(std::shared_ptr<auditgate::service::AuditQueryService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuditQueryServer::Recent(::grpc::ServerContext*, const RecentRequest* req, EventsResponse* resp) {
  try {
    *resp = service_->Recent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuditQueryServer::Query(::grpc::ServerContext*, const QueryRequest* req, EventsResponse* resp) {
  try {
    *resp = service_->Query(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuditQueryServer::Summary(::grpc::ServerContext*, const SummaryRequest* req, SummaryResponse* resp) {
  try {
    *resp = service_->Summary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace auditgate::grpc
