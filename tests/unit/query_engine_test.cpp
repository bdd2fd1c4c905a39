#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/audit/query_engine.hpp"
#include "internal/audit/store_initializer.hpp"
#include "internal/db/memory/memory_event_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using auditgate::audit::QueryEngine;
using auditgate::audit::QueryOptions;
using auditgate::audit::QueryParams;
using auditgate::audit::StoreInitializer;
using auditgate::db::memory::MemoryEventStore;
using auditgate::db::model::InvocationEvent;
using auditgate::db::model::InvocationStatus;
using auditgate::util::ValidationError;

template <typename Fn>
std::string ExpectValidationError(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationError& e) {
    return e.Parameter();
  }
  assert(false && "expected a ValidationError");
  return {};
}

int64_t Ms(const std::string& iso) {
  return auditgate::util::ToUnixMillis(*auditgate::util::ParseIso8601(iso));
}

struct Fixture {
  int                               factory_calls = 0;
  std::shared_ptr<MemoryEventStore> store         = std::make_shared<MemoryEventStore>();
  std::shared_ptr<StoreInitializer> initializer;
  std::unique_ptr<QueryEngine>      engine;

  explicit Fixture(QueryOptions options = {}) {
    initializer = std::make_shared<StoreInitializer>([this] {
      ++factory_calls;
      return store;
    });
    engine = std::make_unique<QueryEngine>(initializer, options);
  }

  void Add(const std::string& operation, const std::string& timestamp, bool error = false, std::optional<std::string> session = std::nullopt) {
    InvocationEvent event;
    event.operation_name = operation;
    event.timestamp_ms   = Ms(timestamp);
    event.duration_ms    = 1.0;
    event.session_id     = std::move(session);
    if (error) {
      event.status       = InvocationStatus::kError;
      event.error_detail = "failed";
    }
    assert(store->Append(event));
  }
};

void TestParseLimit() {
  using auditgate::audit::ParseLimit;
  assert(ParseLimit(std::nullopt, 50, 1000) == 50);
  assert(ParseLimit(std::string(""), 100, 1000) == 100);
  assert(ParseLimit(std::string("7"), 50, 1000) == 7);
  assert(ParseLimit(std::string(" 12 "), 50, 1000) == 12);
  assert(ParseLimit(std::string("5000"), 50, 1000) == 1000);
  assert(ParseLimit(std::string("99999999999999999999999"), 50, 1000) == 1000);

  assert(ExpectValidationError([] { ParseLimit(std::string("0"), 50, 1000); }) == "limit");
  assert(ExpectValidationError([] { ParseLimit(std::string("-5"), 50, 1000); }) == "limit");
  assert(ExpectValidationError([] { ParseLimit(std::string("ten"), 50, 1000); }) == "limit");
  assert(ExpectValidationError([] { ParseLimit(std::string("2.5"), 50, 1000); }) == "limit");
}

void TestParseBool() {
  using auditgate::audit::ParseBool;
  for (const char* truthy : {"true", "TRUE", "1", "yes", "On"}) {
    assert(ParseBool("errors_only", std::string(truthy)));
  }
  for (const char* falsy : {"false", "False", "0", "no", "OFF", ""}) {
    assert(!ParseBool("errors_only", std::string(falsy)));
  }
  assert(!ParseBool("errors_only", std::nullopt));
  assert(ExpectValidationError([] { ParseBool("errors_only", std::string("maybe")); }) == "errors_only");
}

void TestParseTimestamp() {
  using auditgate::audit::ParseTimestampMs;
  assert(!ParseTimestampMs("since", std::nullopt).has_value());
  assert(!ParseTimestampMs("since", std::string("")).has_value());
  assert(ParseTimestampMs("since", std::string("2024-03-01")) == std::optional<int64_t>(Ms("2024-03-01T00:00:00Z")));
  assert(ParseTimestampMs("since", std::string("2024-03-01 10:00")) == std::optional<int64_t>(Ms("2024-03-01T10:00:00Z")));
  assert(ExpectValidationError([] { ParseTimestampMs("until", std::string("yesterday")); }) == "until");
  assert(ExpectValidationError([] { ParseTimestampMs("since", std::string("2024-13-01")); }) == "since");
}

void TestRejectedQueriesNeverTouchTheStore() {
  Fixture f;

  QueryParams bad_since;
  bad_since.since = "not-a-date";
  assert(ExpectValidationError([&] { f.engine->Query(bad_since); }) == "since");

  QueryParams bad_limit;
  bad_limit.limit = "-1";
  assert(ExpectValidationError([&] { f.engine->Query(bad_limit); }) == "limit");

  QueryParams bad_flag;
  bad_flag.errors_only = "sometimes";
  assert(ExpectValidationError([&] { f.engine->Query(bad_flag); }) == "errors_only");

  QueryParams inverted;
  inverted.since = "2024-03-02";
  inverted.until = "2024-03-01";
  assert(ExpectValidationError([&] { f.engine->Query(inverted); }) == "since");

  assert(ExpectValidationError([&] { f.engine->Recent(std::string("0")); }) == "limit");

  assert(f.factory_calls == 0);
  assert(!f.initializer->IsReady());
}

void TestFirstReadInitializesEmptyStore() {
  Fixture f;
  assert(f.engine->Recent(std::nullopt).empty());
  assert(f.factory_calls == 1);

  const auto summary = f.engine->Summary();
  assert(summary.total_events == 0);
  assert(summary.error_rate == 0.0);
  assert(f.factory_calls == 1);
}

void TestRecentAppliesDefaultLimit() {
  QueryOptions options;
  options.recent_default_limit = 3;
  options.query_default_limit  = 4;
  options.max_limit            = 5;
  Fixture f(options);
  for (int i = 0; i < 10; ++i) {
    f.Add("op", "2024-03-01T00:00:0" + std::to_string(i));
  }

  auto recent = f.engine->Recent(std::nullopt);
  assert(recent.size() == 3);
  assert(recent[0].id == 10);

  assert(f.engine->Query(QueryParams{}).size() == 4);

  QueryParams big;
  big.limit = "500";
  assert(f.engine->Query(big).size() == 5);
}

void TestQueryNormalizesFilters() {
  Fixture f;
  f.Add("lookup", "2024-03-01T08:00:00Z", false, "a");
  f.Add("lookup", "2024-03-01T09:00:00Z", true, "b");
  f.Add("search", "2024-03-01T10:00:00Z", true, "a");
  f.Add("lookup", "2024-03-02T10:00:00Z", false, "a");

  QueryParams empty_strings;
  empty_strings.operation_name = "";
  empty_strings.session_id     = "";
  empty_strings.errors_only    = "";
  assert(f.engine->Query(empty_strings).size() == 4);

  QueryParams errors;
  errors.errors_only = "yes";
  auto failed        = f.engine->Query(errors);
  assert(failed.size() == 2);
  assert(failed[0].operation_name == "search");

  QueryParams window;
  window.since = "2024-03-01T09:00:00Z";
  window.until = "2024-03-01T10:00:00+00:00";
  assert(f.engine->Query(window).size() == 2);

  // offsets are converted to UTC: 11:00+02:00 is 09:00Z
  QueryParams offset;
  offset.until = "2024-03-01T11:00:00+02:00";
  assert(f.engine->Query(offset).size() == 2);

  QueryParams combined;
  combined.operation_name = "lookup";
  combined.session_id     = "a";
  combined.since          = "2024-03-01";
  combined.until          = "2024-03-01 23:59:59.999";
  auto one                = f.engine->Query(combined);
  assert(one.size() == 1);
  assert(one[0].id == 1);
}

} // namespace

int main() {
  TestParseLimit();
  TestParseBool();
  TestParseTimestamp();
  TestRejectedQueriesNeverTouchTheStore();
  TestFirstReadInitializesEmptyStore();
  TestRecentAppliesDefaultLimit();
  TestQueryNormalizesFilters();

  std::cout << "auditgate_unit_query_engine: pass\n";
  return 0;
}
