#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/audit/query_engine.hpp"
#include "internal/audit/recorder.hpp"
#include "internal/audit/store_initializer.hpp"
#include "internal/gateway/dispatcher.hpp"
#include "internal/service/audit_query_service.hpp"
#include "internal/service/gateway_service.hpp"

namespace auditgate::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<audit::StoreInitializer> initializer;
  std::shared_ptr<audit::Recorder>         recorder;
  std::shared_ptr<audit::QueryEngine>      query_engine;
  std::shared_ptr<gateway::Dispatcher>     dispatcher;

  std::shared_ptr<service::AuditQueryService> audit_query_service;
  std::shared_ptr<service::GatewayService>    gateway_service;
};

// Store factory for the configured backend; nothing is opened until called.
audit::StoreFactory MakeStoreFactory(const auditgate::runtime::config::AuditConfig& config);

audit::RecorderOptions ToRecorderOptions(const auditgate::runtime::config::RecorderConfig& config);
audit::QueryOptions    ToQueryOptions(const auditgate::runtime::config::QueryConfig& config);

/*
  Build

  Composition root. It is the ONLY place allowed to know concrete store
  types. The store itself is not opened here; the first audit write or read
  does that.
*/
Application Build(const auditgate::runtime::config::RuntimeConfig& config);

} // namespace auditgate::factory
