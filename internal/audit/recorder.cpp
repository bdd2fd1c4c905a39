#include "recorder.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace auditgate::audit {

namespace {

constexpr const char* kUnknownError = "unknown error";

std::optional<std::string> NonEmpty(const std::optional<std::string>& value) {
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> NormalizeArguments(const std::optional<std::string>& arguments) {
  if (!arguments || arguments->empty() || *arguments == "{}") {
    return std::nullopt;
  }
  return arguments;
}

} // namespace

db::model::InvocationEvent ToEvent(const InvocationRecord& record) {
  db::model::InvocationEvent event;
  event.timestamp_ms   = util::ToUnixMillis(record.completed_at.value_or(util::Now()));
  event.operation_name = record.operation_name;
  event.session_id     = NonEmpty(record.caller.session_id);
  event.client_name    = NonEmpty(record.caller.client_name);
  event.client_version = NonEmpty(record.caller.client_version);
  event.request_id     = NonEmpty(record.caller.request_id);
  event.arguments      = NormalizeArguments(record.arguments);
  event.duration_ms    = record.duration_ms;

  if (record.outcome.ok) {
    event.status = db::model::InvocationStatus::kSuccess;
  } else {
    event.status       = db::model::InvocationStatus::kError;
    event.error_detail = record.outcome.error_message.empty() ? std::string(kUnknownError) : record.outcome.error_message;
  }
  return event;
}

Recorder::Recorder(std::shared_ptr<StoreInitializer> initializer, RecorderOptions options)
    : initializer_(std::move(initializer)), options_(options) {
  if (options_.queue_capacity == 0) {
    options_.queue_capacity = 1;
  }
}

Recorder::~Recorder() {
  Stop();
}

void Recorder::Start() {
  if (options_.mode != RecorderMode::kAsync) {
    return;
  }

  std::lock_guard lifecycle(lifecycle_mutex_);
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  shutdown_ = false;
  running_  = true;
  thread_   = std::thread(&Recorder::Run, this);
}

void Recorder::Stop() {
  // A concurrent Stop() waits here until the first one has drained and joined.
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    shutdown_ = true;
  }
  work_cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }

  std::lock_guard lock(mutex_);
  running_ = false;
  idle_cv_.notify_all();
}

void Recorder::Record(InvocationRecord record) noexcept {
  if (!record.completed_at) {
    record.completed_at = util::Now();
  }

  if (options_.mode == RecorderMode::kAsync) {
    std::size_t depth = 0;
    try {
      std::unique_lock lock(mutex_);
      if (running_ && !shutdown_) {
        if (queue_.size() >= options_.queue_capacity) {
          ++dropped_;
          lock.unlock();
          AUDITGATE_LOG_WARN("audit queue full; dropping record",
                             {observability::StringField("operation", record.operation_name),
                              observability::IntField("capacity", static_cast<std::int64_t>(options_.queue_capacity))});
          observability::Metrics::Instance().RecordAuditWrite("dropped");
          return;
        }
        queue_.push_back(std::move(record));
        depth = queue_.size();
        lock.unlock();
        work_cv_.notify_one();
        observability::Metrics::Instance().SetAuditQueueDepth(depth);
        return;
      }
    } catch (const std::exception& e) {
      AUDITGATE_LOG_ERROR("audit enqueue failed", {observability::StringField("error", e.what())});
      observability::Metrics::Instance().RecordAuditWrite("failed");
      return;
    }
  }

  Write(record);
}

void Recorder::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return !running_ || (queue_.empty() && in_flight_ == 0); });
}

std::uint64_t Recorder::DroppedCount() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

void Recorder::Run() {
  while (true) {
    InvocationRecord record;
    std::size_t      depth = 0;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) {
        break;
      }
      record = std::move(queue_.front());
      queue_.pop_front();
      depth = queue_.size();
      ++in_flight_;
    }
    observability::Metrics::Instance().SetAuditQueueDepth(depth);

    Write(record);

    {
      std::lock_guard lock(mutex_);
      --in_flight_;
      if (queue_.empty() && in_flight_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

void Recorder::Write(const InvocationRecord& record) noexcept {
  try {
    auto event = ToEvent(record);
    auto store = initializer_->EnsureReady();

    const auto result = store->Append(event);
    if (!result) {
      AUDITGATE_LOG_ERROR("audit write failed",
                          {observability::StringField("operation", record.operation_name),
                           observability::StringField("code", db::ToString(result.code)),
                           observability::StringField("error", result.message)});
      observability::Metrics::Instance().RecordAuditWrite("failed");
      return;
    }

    AUDITGATE_LOG_DEBUG("audit event written",
                        {observability::IntField("id", static_cast<std::int64_t>(event.id)),
                         observability::StringField("operation", event.operation_name)});
    observability::Metrics::Instance().RecordAuditWrite("written");
  } catch (const std::exception& e) {
    AUDITGATE_LOG_ERROR("audit write failed",
                        {observability::StringField("operation", record.operation_name), observability::StringField("error", e.what())});
    observability::Metrics::Instance().RecordAuditWrite("failed");
  }
}

} // namespace auditgate::audit
