#pragma once

#include <stdexcept>
#include <string>

namespace auditgate::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed caller input. The message names the offending parameter.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string parameter, const std::string& msg)
      : std::runtime_error(parameter + ": " + msg), parameter_(std::move(parameter)) {
  }

  const std::string& Parameter() const {
    return parameter_;
  }

 private:
  std::string parameter_;
};

// The audit store could not be created or schema-migrated. Retryable.
class InitializationError : public std::runtime_error {
 public:
  explicit InitializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage I/O failed while reading. Retryable.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace auditgate::util
