#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/db/model/invocation_event.hpp"
#include "internal/util/time.hpp"
#include "store_initializer.hpp"

namespace auditgate::audit {

struct CallerIdentity {
  std::optional<std::string> session_id;
  std::optional<std::string> client_name;
  std::optional<std::string> client_version;
  std::optional<std::string> request_id;
};

struct Outcome {
  bool        ok = true;
  std::string error_message;

  static Outcome Success() {
    return {};
  }

  static Outcome Failure(std::string message) {
    return {false, std::move(message)};
  }
};

// Terminal state of one operation invocation.
struct InvocationRecord {
  std::string                    operation_name;
  CallerIdentity                 caller;
  std::optional<std::string>     arguments; // serialized JSON object
  Outcome                        outcome;
  double                         duration_ms = 0.0;
  std::optional<util::TimePoint> completed_at; // defaults to the time Record() is called
};

enum class RecorderMode {
  kAsync,
  kSync,
};

struct RecorderOptions {
  RecorderMode mode           = RecorderMode::kAsync;
  std::size_t  queue_capacity = 1024;
};

// Builds the persisted event. Empty identity strings become absent, an empty
// argument object becomes absent, and an error with no message gets
// "unknown error".
db::model::InvocationEvent ToEvent(const InvocationRecord& record);

/*
  Best-effort audit write path.

  Record() never throws and never reports audit failures to the caller.
  Failures go to the log and to auditgate.audit.write.count{outcome}.

  Async mode: records are queued (bounded) and written by one background
  thread; a full queue drops the record with a warning. Until Start() is
  called, and after Stop(), records are written inline.

  Sync mode: records are written inline, bounded by the store's busy timeout.
*/
class Recorder {
 public:
  Recorder(std::shared_ptr<StoreInitializer> initializer, RecorderOptions options = {});
  ~Recorder();

  Recorder(const Recorder&)            = delete;
  Recorder& operator=(const Recorder&) = delete;

  void Start();

  // Drains the queue and joins the writer thread.
  void Stop();

  void Record(InvocationRecord record) noexcept;

  // Blocks until every record queued before the call has been attempted.
  void Flush();

  std::uint64_t DroppedCount() const;

 private:
  void Run();
  void Write(const InvocationRecord& record) noexcept;

  std::shared_ptr<StoreInitializer> initializer_;
  RecorderOptions                   options_;

  std::mutex                   lifecycle_mutex_;
  mutable std::mutex           mutex_;
  std::condition_variable      work_cv_;
  std::condition_variable      idle_cv_;
  std::deque<InvocationRecord> queue_;
  std::size_t                  in_flight_ = 0;
  bool                         running_   = false;
  bool                         shutdown_  = false;
  std::uint64_t                dropped_   = 0;

  std::thread thread_;
};

} // namespace auditgate::audit
