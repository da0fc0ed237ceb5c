#pragma once

#include <map>
#include <string>

namespace fanout::core {

/// Error kinds. Retry decisions and outcome reporting branch on these
/// without parsing messages.
enum class ErrorKind {
  Transient, // Network failure, server-side fault; retryable
  Permanent, // Client-side fault, malformed input, programmer error
  Cancelled, // Did not run, or aborted, because a token was cancelled
  Malformed  // A decoded frame could not be parsed (stream-local)
};

/// Numeric codes for log aggregation, grouped by origin.
namespace error_code {
constexpr int kGeneric = 0;
constexpr int kInvalidConcurrency = 2001;
constexpr int kUnitThrew = 2002;
constexpr int kNullUnit = 2003;
constexpr int kCancelled = 3001;
constexpr int kDeadlineExceeded = 3002;
constexpr int kStreamStopped = 3003;
constexpr int kMalformedFrame = 4001;
} // namespace error_code

/// Structured error carried by every failed Result and TaskOutcome.
struct TaskError {
  ErrorKind kind = ErrorKind::Permanent;
  int code = error_code::kGeneric;
  std::string message;
  std::map<std::string, std::string> details; // e.g. "http_status": "503"

  TaskError() = default;

  TaskError(ErrorKind k, int c, std::string msg,
            std::map<std::string, std::string> dets = {})
      : kind(k), code(c), message(std::move(msg)), details(std::move(dets)) {}

  static TaskError Transient(std::string msg) {
    return {ErrorKind::Transient, error_code::kGeneric, std::move(msg)};
  }
  static TaskError Permanent(std::string msg) {
    return {ErrorKind::Permanent, error_code::kGeneric, std::move(msg)};
  }
  static TaskError Cancelled(std::string msg = "Operation cancelled") {
    return {ErrorKind::Cancelled, error_code::kCancelled, std::move(msg)};
  }
  static TaskError Malformed(std::string msg) {
    return {ErrorKind::Malformed, error_code::kMalformedFrame, std::move(msg)};
  }

  [[nodiscard]] bool is_cancelled() const noexcept {
    return kind == ErrorKind::Cancelled;
  }
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Transient:
    return "Transient";
  case ErrorKind::Permanent:
    return "Permanent";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::Malformed:
    return "Malformed";
  }
  return "Unknown";
}

} // namespace fanout::core
