#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/audit/recorder.hpp"

namespace auditgate::gateway {

using CallerContext = audit::CallerIdentity;

// Receives the arguments as a JSON object (possibly empty) and returns the
// result as JSON text. Throws to report failure.
using OperationHandler = std::function<std::string(const std::string& arguments_json, const CallerContext& caller)>;

struct OperationSpec {
  std::string      name;
  std::string      description;
  bool             audited = true;
  OperationHandler handler;
};

struct OperationDescriptor {
  std::string name;
  std::string description;
  bool        audited = true;
};

/*
  Operation registry with an audit wrapper.

  Invoke() records exactly one event per audited invocation once it reaches a
  terminal state, and rethrows handler failures unchanged. Unknown names are
  audited as errors and reported as util::NotFound.
*/
class Dispatcher {
 public:
  explicit Dispatcher(std::shared_ptr<audit::Recorder> recorder);

  // Throws util::AlreadyExists on a duplicate name.
  void Register(OperationSpec spec);

  std::string Invoke(const std::string& name, const std::string& arguments_json, const CallerContext& caller);

  std::vector<OperationDescriptor> ListOperations() const;

 private:
  std::shared_ptr<audit::Recorder> recorder_;

  mutable std::shared_mutex            mutex_;
  std::map<std::string, OperationSpec> operations_;
};

} // namespace auditgate::gateway
