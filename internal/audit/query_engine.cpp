#include "query_engine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace auditgate::audit {

namespace {

std::optional<std::string> NonEmpty(const std::optional<std::string>& raw) {
  if (!raw || raw->empty()) {
    return std::nullopt;
  }
  return raw;
}

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

std::size_t ParseLimit(const std::optional<std::string>& raw, std::size_t default_limit, std::size_t max_limit) {
  const auto cap = std::max<std::size_t>(max_limit, 1);
  if (!NonEmpty(raw)) {
    return std::clamp<std::size_t>(default_limit, 1, cap);
  }

  const auto text = Trim(*raw);
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw util::ValidationError("limit", "must be a positive integer, got '" + *raw + "'");
  }

  unsigned long long value = 0;
  const auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return cap;
  }
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    throw util::ValidationError("limit", "must be a positive integer, got '" + *raw + "'");
  }
  if (value < 1) {
    throw util::ValidationError("limit", "must be at least 1");
  }
  return value > cap ? cap : static_cast<std::size_t>(value);
}

bool ParseBool(const std::string& parameter, const std::optional<std::string>& raw) {
  if (!raw) {
    return false;
  }

  const auto value = ToLower(Trim(*raw));
  if (value.empty() || value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  throw util::ValidationError(parameter, "expected a boolean (true/false/1/0/yes/no/on/off), got '" + *raw + "'");
}

std::optional<int64_t> ParseTimestampMs(const std::string& parameter, const std::optional<std::string>& raw) {
  if (!NonEmpty(raw)) {
    return std::nullopt;
  }

  const auto parsed = util::ParseIso8601(Trim(*raw));
  if (!parsed) {
    throw util::ValidationError(parameter, "expected an ISO-8601 timestamp, got '" + *raw + "'");
  }
  return util::ToUnixMillis(*parsed);
}

NormalizedQuery Normalize(const QueryParams& params, const QueryOptions& options) {
  NormalizedQuery query;
  query.filter.operation_name = NonEmpty(params.operation_name);
  query.filter.session_id     = NonEmpty(params.session_id);
  query.filter.client_name    = NonEmpty(params.client_name);
  query.filter.since_ms       = ParseTimestampMs("since", params.since);
  query.filter.until_ms       = ParseTimestampMs("until", params.until);
  query.filter.errors_only    = ParseBool("errors_only", params.errors_only);
  query.limit                 = ParseLimit(params.limit, options.query_default_limit, options.max_limit);

  if (query.filter.since_ms && query.filter.until_ms && *query.filter.since_ms > *query.filter.until_ms) {
    throw util::ValidationError("since", "must not be later than until");
  }
  return query;
}

QueryEngine::QueryEngine(std::shared_ptr<StoreInitializer> initializer, QueryOptions options)
    : initializer_(std::move(initializer)), options_(options) {
}

std::vector<db::model::InvocationEvent> QueryEngine::Recent(const std::optional<std::string>& limit) {
  const auto n = ParseLimit(limit, options_.recent_default_limit, options_.max_limit);
  return initializer_->EnsureReady()->Scan(db::EventFilter{}, n);
}

std::vector<db::model::InvocationEvent> QueryEngine::Query(const QueryParams& params) {
  const auto query = Normalize(params, options_);
  return initializer_->EnsureReady()->Scan(query.filter, query.limit);
}

db::model::AuditSummary QueryEngine::Summary() {
  return initializer_->EnsureReady()->Aggregate();
}

uint64_t QueryEngine::EventCount() {
  return initializer_->EnsureReady()->Count();
}

} // namespace auditgate::audit
