#pragma once

#include <memory>

namespace auditgate::audit {
class QueryEngine;
}
namespace auditgate::gateway {
class Dispatcher;
}

namespace auditgate::service {

/*
  Registers the operations every gateway exposes:

    audit.recent   {limit}                       not audited
    audit.query    {operation_name, session_id,  not audited
                    client_name, since, until,
                    errors_only, limit}
    audit.summary  {}                            not audited
    gateway.ping   {}                            audited
                   -> {status, audit_events, time}

  Audit introspection is not audited so reading the log does not grow it.
*/
void RegisterBuiltinOperations(gateway::Dispatcher& dispatcher, std::shared_ptr<audit::QueryEngine> query_engine);

}
