#pragma once

#include <stdexcept>
#include <string>

namespace telemetry::util {

/*
  Central error types.

  These get translated later to gRPC status codes (see grpc_error.cpp).
  Each pipeline gate rejects with exactly one of them.
*/

// Unknown serial, missing/expired credential or wrong secret. Reported uniformly.
class AuthenticationFailure : public std::runtime_error {
 public:
  explicit AuthenticationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient: caller should back off and retry later.
class RateLimitExceeded : public std::runtime_error {
 public:
  explicit RateLimitExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Non-transient until plan change or usage recomputation.
class QuotaExceeded : public std::runtime_error {
 public:
  explicit QuotaExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Never surfaced to the ingesting device; logged by the notifier only.
class NotificationDispatchFailure : public std::runtime_error {
 public:
  explicit NotificationDispatchFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

} // namespace telemetry::util
