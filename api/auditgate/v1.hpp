#pragma once

// Message types only; the gRPC stubs live in the *.grpc.pb.h headers.
#include "auditgate/v1/event.pb.h"

#include "auditgate/v1/audit_query_service.pb.h"
#include "auditgate/v1/gateway_service.pb.h"
