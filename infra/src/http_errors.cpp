#include "infra/http_errors.h"

namespace fanout::infra {

const char *to_string(HttpErrorCode code) {
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
    return "NETWORK_ERROR";
  case HttpErrorCode::TIMEOUT:
    return "TIMEOUT";
  case HttpErrorCode::CANCELED:
    return "CANCELED";
  case HttpErrorCode::SERVER_ERROR:
    return "SERVER_ERROR";
  case HttpErrorCode::CLIENT_ERROR:
    return "CLIENT_ERROR";
  case HttpErrorCode::RATE_LIMIT:
    return "RATE_LIMIT";
  case HttpErrorCode::PARSE_ERROR:
    return "PARSE_ERROR";
  case HttpErrorCode::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

fanout::core::ErrorKind kind_of(HttpErrorCode code) {
  using fanout::core::ErrorKind;
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
  case HttpErrorCode::TIMEOUT:
  case HttpErrorCode::SERVER_ERROR:
  case HttpErrorCode::RATE_LIMIT:
    return ErrorKind::Transient;
  case HttpErrorCode::CANCELED:
    return ErrorKind::Cancelled;
  case HttpErrorCode::PARSE_ERROR:
    return ErrorKind::Malformed;
  case HttpErrorCode::CLIENT_ERROR:
  case HttpErrorCode::UNKNOWN:
    return ErrorKind::Permanent;
  }
  return ErrorKind::Permanent;
}

std::optional<HttpErrorCode> classify_http_status(long status) {
  if (status >= 500) {
    return HttpErrorCode::SERVER_ERROR;
  }
  if (status == 429) {
    return HttpErrorCode::RATE_LIMIT;
  }
  if (status == 408) {
    return HttpErrorCode::TIMEOUT;
  }
  if (status >= 400) {
    return HttpErrorCode::CLIENT_ERROR;
  }
  return std::nullopt;
}

fanout::core::TaskError make_http_error(HttpErrorCode code,
                                        const std::string &message,
                                        const std::string &internal_message) {
  return fanout::core::TaskError(
      kind_of(code), static_cast<int>(code), message,
      {{"http_error_code", std::to_string(static_cast<int>(code))},
       {"http_error", to_string(code)},
       {"internal_message", internal_message}});
}

} // namespace fanout::infra
