#pragma once

#include <map>
#include <string>

namespace wake::core {

/// Error categories, so callers can branch on the kind of failure without
/// parsing messages.
enum class ErrorCategory {
  Validation,  // Malformed input, rejected before any side effect
  Remote,      // The wake service answered with a failure
  Network,     // Transport could not reach the wake service
  Timeout,     // Transport deadline exceeded
  Persistence, // Durable store read/write failure
  NotFound,    // Unknown task id
  Internal,    // Invariant violation
  Unknown
};

/// Structured error used by every core and infra operation.
struct WakeError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0; // Numeric code for log aggregation

  bool retryable = false;
  std::string user_message;     // Short text suitable for history/UI
  std::string internal_message; // Technical detail for logs
  std::map<std::string, std::string> details;

  WakeError() = default;

  WakeError(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), user_message(msg),
        internal_message(std::move(msg)) {}

  WakeError(ErrorCategory cat, int c, bool retry, std::string user_msg,
            std::string internal_msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), retryable(retry),
        user_message(std::move(user_msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  static WakeError Validation(std::string msg) {
    return {ErrorCategory::Validation, 1, std::move(msg)};
  }
  static WakeError Remote(std::string msg) {
    return {ErrorCategory::Remote, 2, std::move(msg)};
  }
  static WakeError Persistence(std::string msg) {
    return {ErrorCategory::Persistence, 3, std::move(msg)};
  }
  static WakeError NotFound(const std::string &what) {
    return {ErrorCategory::NotFound, 4, "Not found: " + what};
  }
  static WakeError Internal(std::string msg) {
    return {ErrorCategory::Internal, 5, std::move(msg)};
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Validation:
    return "Validation";
  case ErrorCategory::Remote:
    return "Remote";
  case ErrorCategory::Network:
    return "Network";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::Persistence:
    return "Persistence";
  case ErrorCategory::NotFound:
    return "NotFound";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace wake::core
