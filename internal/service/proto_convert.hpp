#pragma once

#include "auditgate/v1/event.pb.h"
#include "internal/db/model/audit_summary.hpp"
#include "internal/db/model/invocation_event.hpp"

namespace auditgate::service {

auditgate::v1::InvocationEvent ToProto(const db::model::InvocationEvent& event);
auditgate::v1::AuditSummary    ToProto(const db::model::AuditSummary& summary);

}
