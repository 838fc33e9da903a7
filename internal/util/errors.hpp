#pragma once

#include <stdexcept>
#include <string>

namespace reel::util {

/*
  Central error types.

  Service-level errors get translated to gRPC status codes. Domain errors
  carry a stable kind string that ends up in TaskError.kind when a stage
  fails.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Allocator input cannot satisfy the minimum scene floor. Never retried.
class ConstraintViolation : public std::runtime_error {
 public:
  explicit ConstraintViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Media probe could not read duration. Retryable.
class ProbeFailure : public std::runtime_error {
 public:
  explicit ProbeFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AdjustmentDivergence : public std::runtime_error {
 public:
  explicit AdjustmentDivergence(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Rate limit, timeout, unavailable upstream. Retried with backoff.
class ProviderTransient : public std::runtime_error {
 public:
  explicit ProviderTransient(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Invalid input or rejected request. Fails the stage immediately.
class ProviderPermanent : public std::runtime_error {
 public:
  explicit ProviderPermanent(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MediaToolError : public std::runtime_error {
 public:
  explicit MediaToolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TaskTimeout : public std::runtime_error {
 public:
  explicit TaskTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Cooperative abort. Not an error from the task's point of view.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg = "cancelled") : std::runtime_error(msg) {
  }
};

/*
  Stable kind string for a stage failure.
*/
const char* ErrorKind(const std::exception& e);

bool IsRetryable(const std::exception& e);

} // namespace reel::util
