#include "infra/curl_stream_source.h"

namespace fanout::infra {

CurlStreamSource::CurlStreamSource(std::shared_ptr<fanout::core::ILogger> logger)
    : logger_(std::move(logger)) {}

bool CurlStreamSource::available() noexcept { return false; }

fanout::core::Result<StreamResponse, fanout::core::TaskError>
CurlStreamSource::stream(const StreamRequest &, const fanout::core::ChunkSink &,
                         const std::shared_ptr<fanout::core::CancelToken> &) const {
  return fanout::core::Result<StreamResponse, fanout::core::TaskError>::Err(
      make_http_error(HttpErrorCode::UNKNOWN,
                      "HTTP stream backend unavailable on this build.",
                      "libcurl development package not found at build time"));
}

} // namespace fanout::infra
