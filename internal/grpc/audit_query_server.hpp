#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "auditgate/v1/audit_query_service.grpc.pb.h"
#include "internal/service/audit_query_service.hpp"

namespace auditgate::grpc {

class AuditQueryServer final : public auditgate::v1::AuditQueryService::Service {
public:
  explicit AuditQueryServer(std::shared_ptr<auditgate::service::AuditQueryService> svc);

  ::grpc::Status Recent(::grpc::ServerContext*,
                        const auditgate::v1::RecentRequest*,
                        auditgate::v1::EventsResponse*) override;

  ::grpc::Status Query(::grpc::ServerContext*,
                       const auditgate::v1::QueryRequest*,
                       auditgate::v1::EventsResponse*) override;

  ::grpc::Status Summary(::grpc::ServerContext*,
                         const auditgate::v1::SummaryRequest*,
                         auditgate::v1::SummaryResponse*) override;

private:
  std::shared_ptr<auditgate::service::AuditQueryService> service_;
};

}
