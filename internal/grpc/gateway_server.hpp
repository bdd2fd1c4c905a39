#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "auditgate/v1/gateway_service.grpc.pb.h"
#include "internal/service/gateway_service.hpp"

namespace auditgate::grpc {

class GatewayServer final : public auditgate::v1::GatewayService::Service {
public:
  explicit GatewayServer(std::shared_ptr<auditgate::service::GatewayService> svc);

  ::grpc::Status Invoke(::grpc::ServerContext*,
                        const auditgate::v1::InvokeRequest*,
                        auditgate::v1::InvokeResponse*) override;

  ::grpc::Status ListOperations(::grpc::ServerContext*,
                                const auditgate::v1::ListOperationsRequest*,
                                auditgate::v1::ListOperationsResponse*) override;

private:
  std::shared_ptr<auditgate::service::GatewayService> service_;
};

}
