#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "auditgate/v1.hpp"
#include "internal/audit/query_engine.hpp"
#include "internal/audit/recorder.hpp"
#include "internal/audit/store_initializer.hpp"
#include "internal/db/memory/memory_event_store.hpp"
#include "internal/gateway/dispatcher.hpp"
#include "internal/grpc/audit_query_server.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/builtin_operations.hpp"
#include "internal/service/service_context.hpp"

namespace {

using auditgate::audit::StoreFactory;

auditgate::service::ServiceContext BuildServiceContext(StoreFactory factory) {
  auto initializer = std::make_shared<auditgate::audit::StoreInitializer>(std::move(factory));
  auto recorder    = std::make_shared<auditgate::audit::Recorder>(
      initializer, auditgate::audit::RecorderOptions{auditgate::audit::RecorderMode::kSync, 16});

  auditgate::service::ServiceContext ctx;
  ctx.query_engine = std::make_shared<auditgate::audit::QueryEngine>(initializer);
  ctx.dispatcher   = std::make_shared<auditgate::gateway::Dispatcher>(recorder);
  auditgate::service::RegisterBuiltinOperations(*ctx.dispatcher, ctx.query_engine);
  return ctx;
}

auditgate::service::ServiceContext BuildServiceContext() {
  return BuildServiceContext([] { return std::make_shared<auditgate::db::memory::MemoryEventStore>(); });
}

void TestExceptionMapping() {
  using auditgate::grpc::ToStatus;
  assert(ToStatus(auditgate::util::ValidationError("limit", "bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(auditgate::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(auditgate::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(auditgate::util::InitializationError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(auditgate::util::StorageError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::logic_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestMalformedSinceReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  auditgate::grpc::AuditQueryServer server(std::make_shared<auditgate::service::AuditQueryService>(ctx));

  auditgate::v1::QueryRequest req;
  req.set_since("03/01/2024");
  auditgate::v1::EventsResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  const auto status = server.Query(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message().find("since") != std::string::npos);
}

void TestNegativeLimitReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  auditgate::grpc::AuditQueryServer server(std::make_shared<auditgate::service::AuditQueryService>(ctx));

  auditgate::v1::RecentRequest req;
  req.set_limit("-3");
  auditgate::v1::EventsResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  assert(server.Recent(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnavailableStoreReturnsUnavailable() {
  auto ctx = BuildServiceContext([]() -> std::shared_ptr<auditgate::db::EventStore> { throw std::runtime_error("read-only filesystem"); });
  auditgate::grpc::AuditQueryServer server(std::make_shared<auditgate::service::AuditQueryService>(ctx));

  auditgate::v1::SummaryRequest  req;
  auditgate::v1::SummaryResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  assert(server.Summary(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestUnknownOperationReturnsNotFound() {
  auto ctx = BuildServiceContext();
  auditgate::grpc::GatewayServer server(std::make_shared<auditgate::service::GatewayService>(ctx));

  auditgate::v1::InvokeRequest req;
  req.set_operation("no.such.operation");
  auditgate::v1::InvokeResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  assert(server.Invoke(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEmptySummaryIsOk() {
  auto ctx = BuildServiceContext();
  auditgate::grpc::AuditQueryServer server(std::make_shared<auditgate::service::AuditQueryService>(ctx));

  auditgate::v1::SummaryRequest  req;
  auditgate::v1::SummaryResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  assert(server.Summary(&grpc_ctx, &req, &resp).ok());
  assert(resp.summary().total_events() == 0);
  assert(resp.summary().error_rate() == 0.0);
  assert(!resp.summary().has_first_event());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMalformedSinceReturnsInvalidArgument();
  TestNegativeLimitReturnsInvalidArgument();
  TestUnavailableStoreReturnsUnavailable();
  TestUnknownOperationReturnsNotFound();
  TestEmptySummaryIsOk();

  std::cout << "auditgate_unit_grpc_status: pass\n";
  return 0;
}
