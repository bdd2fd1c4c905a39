#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/event_store.hpp"
#include "store_initializer.hpp"

namespace auditgate::audit {

// Raw filter input as a transport receives it. Empty strings mean absent.
struct QueryParams {
  std::optional<std::string> operation_name;
  std::optional<std::string> session_id;
  std::optional<std::string> client_name;
  std::optional<std::string> since;
  std::optional<std::string> until;
  std::optional<std::string> errors_only;
  std::optional<std::string> limit;
};

struct QueryOptions {
  std::size_t recent_default_limit = 50;
  std::size_t query_default_limit  = 100;
  std::size_t max_limit            = db::kMaxScanLimit;
};

struct NormalizedQuery {
  db::EventFilter filter;
  std::size_t     limit = 0;
};

// Each throws util::ValidationError naming the parameter.
std::size_t          ParseLimit(const std::optional<std::string>& raw, std::size_t default_limit, std::size_t max_limit);
bool                 ParseBool(const std::string& parameter, const std::optional<std::string>& raw);
std::optional<int64_t> ParseTimestampMs(const std::string& parameter, const std::optional<std::string>& raw);

NormalizedQuery Normalize(const QueryParams& params, const QueryOptions& options);

/*
  Read path over the audit store.

  Input is validated before the store is touched, so a rejected query never
  triggers initialization. Reads are pure and safe to run concurrently.
*/
class QueryEngine {
 public:
  QueryEngine(std::shared_ptr<StoreInitializer> initializer, QueryOptions options = {});

  std::vector<db::model::InvocationEvent> Recent(const std::optional<std::string>& limit);
  std::vector<db::model::InvocationEvent> Query(const QueryParams& params);
  db::model::AuditSummary                 Summary();

  // Number of stored events; initializes the store if needed.
  uint64_t EventCount();

 private:
  std::shared_ptr<StoreInitializer> initializer_;
  QueryOptions                      options_;
};

} // namespace auditgate::audit
