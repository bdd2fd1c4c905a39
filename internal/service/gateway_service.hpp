#pragma once

#include "auditgate/v1/gateway_service.pb.h"
#include "service_context.hpp"

namespace auditgate::service {

class GatewayService {
public:
  explicit GatewayService(ServiceContext ctx);

  auditgate::v1::InvokeResponse Invoke(const auditgate::v1::InvokeRequest& req);
  auditgate::v1::ListOperationsResponse ListOperations(const auditgate::v1::ListOperationsRequest& req);

private:
  ServiceContext ctx_;
};

}
