#pragma once

#include <map>
#include <string>
#include <utility>

namespace convoy::core {

/// Error categories. Callers branch on the category, never on message text.
enum class ErrorCategory {
  Validation,  // Bad or empty plan, bad configuration
  Execution,   // A work item or collaborator failed
  Persistence, // Storage I/O failure (always surfaced)
  Listener,    // Event listener threw (isolated, logged)
  Capacity,    // Worker pool has no free slot (backpressure)
  Canceled,    // Process-level shutdown requested
  Timeout,     // Bounded wait exceeded
  NotFound,    // Referenced record does not exist
  Internal,    // Invariant violation / illegal transition
  Unknown
};

/// Structured error for every orchestration operation.
struct Error {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;                 // Stable numeric code for aggregation
  std::string message;          // Human-readable reason, shown to the user
  std::string internal_message; // Technical detail for logs
  std::map<std::string, std::string> details;

  Error() = default;

  Error(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), message(std::move(msg)),
        internal_message(message) {}

  Error(ErrorCategory cat, int c, std::string msg, std::string internal_msg,
        std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  static Error Validation(std::string msg) {
    return {ErrorCategory::Validation, 1001, std::move(msg)};
  }
  static Error Execution(std::string msg) {
    return {ErrorCategory::Execution, 2001, std::move(msg)};
  }
  static Error Persistence(std::string msg, std::string internal_msg) {
    return {ErrorCategory::Persistence, 3001, std::move(msg),
            std::move(internal_msg)};
  }
  static Error PoolAtCapacity(int capacity) {
    return {ErrorCategory::Capacity, 4001, "Worker pool at capacity",
            "spawn() called with no free slot",
            {{"capacity", std::to_string(capacity)}}};
  }
  static Error Canceled(std::string msg = "Operation canceled") {
    return {ErrorCategory::Canceled, 5001, std::move(msg)};
  }
  static Error Timeout(std::string msg = "Deadline exceeded") {
    return {ErrorCategory::Timeout, 5002, std::move(msg)};
  }
  static Error NotFound(std::string what) {
    return {ErrorCategory::NotFound, 6001, "Not found: " + what};
  }
  static Error Internal(std::string msg) {
    return {ErrorCategory::Internal, 9001, std::move(msg)};
  }
};

/// Convert ErrorCategory to string for logging.
inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Validation:
    return "Validation";
  case ErrorCategory::Execution:
    return "Execution";
  case ErrorCategory::Persistence:
    return "Persistence";
  case ErrorCategory::Listener:
    return "Listener";
  case ErrorCategory::Capacity:
    return "Capacity";
  case ErrorCategory::Canceled:
    return "Canceled";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::NotFound:
    return "NotFound";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace convoy::core
