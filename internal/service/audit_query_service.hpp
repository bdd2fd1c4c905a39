#pragma once

#include "auditgate/v1/audit_query_service.pb.h"
#include "service_context.hpp"

namespace auditgate::service {

class AuditQueryService {
public:
  explicit AuditQueryService(ServiceContext ctx);

  auditgate::v1::EventsResponse Recent(const auditgate::v1::RecentRequest& req);
  auditgate::v1::EventsResponse Query(const auditgate::v1::QueryRequest& req);
  auditgate::v1::SummaryResponse Summary(const auditgate::v1::SummaryRequest& req);

private:
  ServiceContext ctx_;
};

}
