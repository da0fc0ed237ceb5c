#pragma once

#include "core/cancel_token.h"
#include "core/orchestrator.h"
#include "core/result.h"
#include "core/task_error.h"
#include "infra/http_errors.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace fanout::core {
class ILogger;
}

namespace fanout::infra {

struct StreamRequest {
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body; // non-empty => POST
  std::string trace_id;
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds connect_timeout{10000};
};

struct StreamResponse {
  long status_code = 0;
  std::size_t bytes_received = 0;
  bool stopped_by_consumer = false; // sink returned false; not an error
  std::chrono::milliseconds elapsed{0};
};

/// Streams an HTTP response body through a ChunkSink using libcurl.
///
/// Every call uses its own easy handle, so one source can serve all slots of
/// a TaskPool concurrently. The transfer aborts when `token` is cancelled
/// (Cancelled error) or when the sink returns false (success with
/// stopped_by_consumer). Statuses >= 400 never reach the sink; they are
/// classified with classify_http_status().
class CurlStreamSource {
public:
  explicit CurlStreamSource(std::shared_ptr<fanout::core::ILogger> logger = nullptr);

  fanout::core::Result<StreamResponse, fanout::core::TaskError>
  stream(const StreamRequest &request, const fanout::core::ChunkSink &sink,
         const std::shared_ptr<fanout::core::CancelToken> &token) const;

  /// StreamUnit over URLs: each item is a URL, the rest of the request comes
  /// from `prototype`. The source must outlive the returned unit.
  [[nodiscard]] fanout::core::StreamUnit<std::string>
  unit_for(StreamRequest prototype) const {
    return [this, prototype](const std::string &url,
                             const fanout::core::ChunkSink &sink,
                             const std::shared_ptr<fanout::core::CancelToken> &token)
               -> fanout::core::Result<void, fanout::core::TaskError> {
      StreamRequest request = prototype;
      request.url = url;
      auto response = stream(request, sink, token);
      if (response.is_err()) {
        return fanout::core::Result<void, fanout::core::TaskError>::Err(
            response.error());
      }
      return fanout::core::Result<void, fanout::core::TaskError>::Ok();
    };
  }

  /// False when the build has no libcurl backend.
  static bool available() noexcept;

private:
  std::shared_ptr<fanout::core::ILogger> logger_;
};

} // namespace fanout::infra
