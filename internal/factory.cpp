#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_event_store.hpp"
#include "internal/db/sqlite/sqlite_event_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/builtin_operations.hpp"
#include "internal/service/service_context.hpp"

namespace auditgate::factory {

using namespace auditgate::runtime::config;

namespace {

constexpr const char* kDefaultDbPath = "auditgate_audit.db";

db::sqlite::SqliteStoreOptions ToSqliteOptions(const SqliteStoreConfig& config) {
  db::sqlite::SqliteStoreOptions options;
  options.path        = config.path().empty() ? kDefaultDbPath : config.path();
  options.synchronous = config.synchronous() == SQLITE_SYNCHRONOUS_NORMAL ? db::sqlite::Synchronous::kNormal : db::sqlite::Synchronous::kFull;
  if (config.busy_timeout_ms() > 0) {
    options.busy_timeout_ms = static_cast<int>(config.busy_timeout_ms());
  }
  if (config.reader_pool_size() > 0) {
    options.reader_pool_size = config.reader_pool_size();
  }
  return options;
}

} // namespace

audit::StoreFactory MakeStoreFactory(const AuditConfig& config) {
  if (config.has_memory()) {
    return [] { return std::static_pointer_cast<db::EventStore>(std::make_shared<db::memory::MemoryEventStore>()); };
  }

  // sqlite is the default backend
  auto options = ToSqliteOptions(config.sqlite());
  return [options] {
    AUDITGATE_LOG_INFO("opening audit store", {observability::StringField("path", options.path)});
    return std::static_pointer_cast<db::EventStore>(db::sqlite::OpenSqliteEventStore(options));
  };
}

audit::RecorderOptions ToRecorderOptions(const RecorderConfig& config) {
  audit::RecorderOptions options;
  options.mode = config.mode() == RECORDER_MODE_SYNC ? audit::RecorderMode::kSync : audit::RecorderMode::kAsync;
  if (config.queue_capacity() > 0) {
    options.queue_capacity = config.queue_capacity();
  }
  return options;
}

audit::QueryOptions ToQueryOptions(const QueryConfig& config) {
  audit::QueryOptions options;
  if (config.max_limit() > 0) {
    options.max_limit = std::min<std::size_t>(config.max_limit(), db::kMaxScanLimit);
  }
  if (config.recent_default_limit() > 0) {
    options.recent_default_limit = config.recent_default_limit();
  }
  if (config.query_default_limit() > 0) {
    options.query_default_limit = config.query_default_limit();
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Audit core
  // ------------------------------------------------------------------
  app.initializer  = std::make_shared<audit::StoreInitializer>(MakeStoreFactory(config.audit()));
  app.recorder     = std::make_shared<audit::Recorder>(app.initializer, ToRecorderOptions(config.audit().recorder()));
  app.query_engine = std::make_shared<audit::QueryEngine>(app.initializer, ToQueryOptions(config.audit().query()));

  app.recorder->Start();

  // ------------------------------------------------------------------
  // Operations
  // ------------------------------------------------------------------
  app.dispatcher = std::make_shared<gateway::Dispatcher>(app.recorder);
  service::RegisterBuiltinOperations(*app.dispatcher, app.query_engine);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.query_engine = app.query_engine;
  ctx.dispatcher   = app.dispatcher;

  app.audit_query_service = std::make_shared<service::AuditQueryService>(ctx);
  app.gateway_service     = std::make_shared<service::GatewayService>(ctx);

  return app;
}

} // namespace auditgate::factory
