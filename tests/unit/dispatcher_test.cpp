#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/audit/query_engine.hpp"
#include "internal/audit/recorder.hpp"
#include "internal/audit/store_initializer.hpp"
#include "internal/db/memory/memory_event_store.hpp"
#include "internal/gateway/dispatcher.hpp"
#include "internal/service/builtin_operations.hpp"
#include "internal/util/errors.hpp"

namespace {

using auditgate::audit::Recorder;
using auditgate::audit::RecorderMode;
using auditgate::audit::RecorderOptions;
using auditgate::audit::StoreInitializer;
using auditgate::db::EventFilter;
using auditgate::db::memory::MemoryEventStore;
using auditgate::db::model::InvocationStatus;
using auditgate::gateway::CallerContext;
using auditgate::gateway::Dispatcher;
using auditgate::gateway::OperationSpec;

struct Fixture {
  std::shared_ptr<MemoryEventStore> store       = std::make_shared<MemoryEventStore>();
  std::shared_ptr<StoreInitializer> initializer = std::make_shared<StoreInitializer>([s = store] { return s; });
  std::shared_ptr<Recorder>         recorder    = std::make_shared<Recorder>(initializer, RecorderOptions{RecorderMode::kSync, 16});
  Dispatcher                        dispatcher{recorder};
};

CallerContext Caller() {
  CallerContext caller;
  caller.session_id     = "session-7";
  caller.client_name    = "desktop";
  caller.client_version = "0.9.1";
  return caller;
}

void TestAuditedSuccessIsRecordedOnce() {
  Fixture f;
  f.dispatcher.Register(OperationSpec{"employee.get", "Fetch one employee", true, [](const std::string& args, const CallerContext&) {
                                        return std::string(R"({"echo":)") + args + "}";
                                      }});

  const auto result = f.dispatcher.Invoke("employee.get", R"({"employee_id":"E1"})", Caller());
  assert(result == R"({"echo":{"employee_id":"E1"}})");

  const auto events = f.store->Scan(EventFilter{}, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].operation_name == "employee.get");
  assert(events[0].status == InvocationStatus::kSuccess);
  assert(events[0].session_id == std::optional<std::string>("session-7"));
  assert(events[0].client_name == std::optional<std::string>("desktop"));
  assert(events[0].client_version == std::optional<std::string>("0.9.1"));
  assert(events[0].arguments == std::optional<std::string>(R"({"employee_id":"E1"})"));
  assert(events[0].duration_ms >= 0.0);
}

void TestHandlerErrorIsRecordedAndRethrown() {
  Fixture f;
  f.dispatcher.Register(OperationSpec{"employee.get", "", true, [](const std::string&, const CallerContext&) -> std::string {
                                        throw std::out_of_range("employee E9 not found upstream");
                                      }});

  bool rethrown = false;
  try {
    f.dispatcher.Invoke("employee.get", "{}", Caller());
  } catch (const std::out_of_range& e) {
    rethrown = std::string(e.what()) == "employee E9 not found upstream";
  }
  assert(rethrown && "the handler's own exception type must reach the caller");

  const auto events = f.store->Scan(EventFilter{}, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].status == InvocationStatus::kError);
  assert(events[0].error_detail == std::optional<std::string>("employee E9 not found upstream"));
  assert(!events[0].arguments.has_value());
}

void TestNonStandardThrowIsRecordedAndRethrown() {
  Fixture f;
  f.dispatcher.Register(OperationSpec{"legacy.call", "", true, [](const std::string&, const CallerContext&) -> std::string {
                                        throw 42;
                                      }});

  bool rethrown = false;
  try {
    f.dispatcher.Invoke("legacy.call", "{}", Caller());
  } catch (int code) {
    rethrown = code == 42;
  }
  assert(rethrown);

  assert(f.store->Count() == 1);
  const auto events = f.store->Scan(EventFilter{}, std::nullopt);
  assert(events[0].operation_name == "legacy.call");
  assert(events[0].status == InvocationStatus::kError);
  assert(events[0].error_detail == std::optional<std::string>("unknown error"));
}

void TestUnauditedOperationsAreNeverRecorded() {
  Fixture f;
  f.dispatcher.Register(OperationSpec{"quiet.ok", "", false, [](const std::string&, const CallerContext&) { return std::string("{}"); }});
  f.dispatcher.Register(OperationSpec{"quiet.fail", "", false, [](const std::string&, const CallerContext&) -> std::string {
                                        throw std::runtime_error("nope");
                                      }});

  (void)f.dispatcher.Invoke("quiet.ok", "{}", Caller());
  bool threw = false;
  try {
    f.dispatcher.Invoke("quiet.fail", "{}", Caller());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.store->Count() == 0);
}

void TestUnknownOperationIsNotFoundAndAudited() {
  Fixture f;
  bool    threw = false;
  try {
    f.dispatcher.Invoke("does.not.exist", "{}", Caller());
  } catch (const auditgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  const auto events = f.store->Scan(EventFilter{}, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].operation_name == "does.not.exist");
  assert(events[0].status == InvocationStatus::kError);
  assert(events[0].error_detail->find("does.not.exist") != std::string::npos);
}

void TestDuplicateRegistrationIsRejected() {
  Fixture f;
  auto    handler = [](const std::string&, const CallerContext&) { return std::string("{}"); };
  f.dispatcher.Register(OperationSpec{"dup", "first", true, handler});

  bool threw = false;
  try {
    f.dispatcher.Register(OperationSpec{"dup", "second", false, handler});
  } catch (const auditgate::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  const auto ops = f.dispatcher.ListOperations();
  assert(ops.size() == 1);
  assert(ops[0].description == "first");
  assert(ops[0].audited);
}

void TestBuiltinOperations() {
  Fixture f;
  auto    engine = std::make_shared<auditgate::audit::QueryEngine>(f.initializer);
  auditgate::service::RegisterBuiltinOperations(f.dispatcher, engine);

  const auto ops = f.dispatcher.ListOperations();
  assert(ops.size() == 4);
  for (const auto& op : ops) {
    assert(op.audited == (op.name == "gateway.ping"));
  }

  const auto pong = f.dispatcher.Invoke("gateway.ping", "{}", Caller());
  assert(pong.find(R"("status":"ok")") != std::string::npos);
  assert(f.store->Count() == 1);

  // reading the log does not grow it
  const auto recent = f.dispatcher.Invoke("audit.recent", R"({"limit":10})", Caller());
  assert(recent.find("gateway.ping") != std::string::npos);
  const auto summary = f.dispatcher.Invoke("audit.summary", "{}", Caller());
  assert(summary.find(R"("total_events":"1")") != std::string::npos);
  assert(f.store->Count() == 1);

  const auto filtered = f.dispatcher.Invoke("audit.query", R"({"operation_name":"gateway.ping","errors_only":true})", Caller());
  assert(filtered.find("gateway.ping") == std::string::npos);

  bool threw = false;
  try {
    f.dispatcher.Invoke("audit.query", R"({"since":"last tuesday"})", Caller());
  } catch (const auditgate::util::ValidationError& e) {
    threw = e.Parameter() == "since";
  }
  assert(threw);
  assert(f.store->Count() == 1);
}

void TestPingReportsStoredEventCount() {
  Fixture f;
  auto    engine = std::make_shared<auditgate::audit::QueryEngine>(f.initializer);
  auditgate::service::RegisterBuiltinOperations(f.dispatcher, engine);

  const auto first = f.dispatcher.Invoke("gateway.ping", "{}", Caller());
  assert(first.find(R"("audit_events":0)") != std::string::npos);

  // the first ping is on the log before the second one runs
  const auto second = f.dispatcher.Invoke("gateway.ping", "{}", Caller());
  assert(second.find(R"("audit_events":1)") != std::string::npos);
  assert(engine->EventCount() == 2);
}

void TestPingFailsWhenStoreIsUnavailable() {
  auto initializer = std::make_shared<StoreInitializer>([]() -> std::shared_ptr<auditgate::db::EventStore> {
    throw std::runtime_error("disk missing");
  });
  auto       recorder = std::make_shared<Recorder>(initializer, RecorderOptions{RecorderMode::kSync, 16});
  Dispatcher dispatcher{recorder};
  auditgate::service::RegisterBuiltinOperations(dispatcher, std::make_shared<auditgate::audit::QueryEngine>(initializer));

  bool threw = false;
  try {
    dispatcher.Invoke("gateway.ping", "{}", Caller());
  } catch (const auditgate::util::InitializationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAuditedSuccessIsRecordedOnce();
  TestHandlerErrorIsRecordedAndRethrown();
  TestNonStandardThrowIsRecordedAndRethrown();
  TestUnauditedOperationsAreNeverRecorded();
  TestUnknownOperationIsNotFoundAndAudited();
  TestDuplicateRegistrationIsRejected();
  TestBuiltinOperations();
  TestPingReportsStoredEventCount();
  TestPingFailsWhenStoreIsUnavailable();

  std::cout << "auditgate_unit_dispatcher: pass\n";
  return 0;
}
