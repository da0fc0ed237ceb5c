#pragma once

#include "core/task_error.h"

#include <optional>
#include <string>

namespace fanout::infra {

// HTTP error classes (also TaskError::code for HTTP-originated failures)
enum class HttpErrorCode {
  NETWORK_ERROR = 1001, // unreachable, DNS failure, connection refused
  TIMEOUT = 1002,       // connect/transfer timeout
  CANCELED = 1003,      // aborted through the cancel token
  SERVER_ERROR = 1004,  // 5xx
  CLIENT_ERROR = 1005,  // 4xx other than 408/429
  RATE_LIMIT = 1006,    // 429
  PARSE_ERROR = 1007,   // body could not be interpreted
  UNKNOWN = 1999
};

const char *to_string(HttpErrorCode code);

/// Error kind for an HTTP error class: network, timeout, 5xx and 429 are
/// Transient; cancellation is Cancelled; parse failures are Malformed;
/// everything else is Permanent.
fanout::core::ErrorKind kind_of(HttpErrorCode code);

/// Error class for a response status, nullopt for 1xx-3xx.
/// 408 counts as a timeout.
std::optional<HttpErrorCode> classify_http_status(long status);

/// Build a TaskError for an HTTP failure. details["http_error_code"] holds
/// the numeric class.
fanout::core::TaskError make_http_error(HttpErrorCode code,
                                        const std::string &message,
                                        const std::string &internal_message);

} // namespace fanout::infra
