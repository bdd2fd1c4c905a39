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
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<auditgate::audit::QueryEngine> query_engine;
  std::shared_ptr<auditgate::gateway::Dispatcher> dispatcher;
};

}
