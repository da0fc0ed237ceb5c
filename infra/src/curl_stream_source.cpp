#include "infra/curl_stream_source.h"

#include "core/logger.h"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <string_view>

namespace fanout::infra {

using fanout::core::Result;
using fanout::core::TaskError;

namespace {

// One-time libcurl global initialization
struct CurlGlobalInit {
  CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
  ~CurlGlobalInit() { curl_global_cleanup(); }
};
static CurlGlobalInit g_curl_init;

constexpr std::size_t kMaxErrorBody = 4096;

/// State shared with the libcurl callbacks for one transfer.
struct Transfer {
  CURL *handle = nullptr;
  const fanout::core::ChunkSink *sink = nullptr;
  fanout::core::CancelToken *token = nullptr;
  long status = 0;
  bool status_known = false;
  std::string error_body;
  std::size_t bytes = 0;
  bool stopped_by_consumer = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *transfer = static_cast<Transfer *>(userdata);
  const size_t total = size * nmemb;

  if (!transfer->status_known) {
    curl_easy_getinfo(transfer->handle, CURLINFO_RESPONSE_CODE,
                      &transfer->status);
    transfer->status_known = true;
  }

  // Error bodies are kept for the message, never streamed.
  if (transfer->status >= 400) {
    const size_t room = kMaxErrorBody - std::min(kMaxErrorBody,
                                                 transfer->error_body.size());
    transfer->error_body.append(ptr, std::min(room, total));
    return total;
  }

  transfer->bytes += total;
  if (transfer->sink && *transfer->sink &&
      !(*transfer->sink)(std::string_view(ptr, total))) {
    transfer->stopped_by_consumer = true;
    return 0; // short write aborts the transfer with CURLE_WRITE_ERROR
  }
  return total;
}

// Non-zero return aborts the transfer (CURLE_ABORTED_BY_CALLBACK)
int xferinfo_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  auto *transfer = static_cast<Transfer *>(clientp);
  if (transfer->token && transfer->token->is_cancelled()) {
    return 1;
  }
  return 0;
}

HttpErrorCode classify_curl_error(CURLcode code) {
  switch (code) {
  case CURLE_COULDNT_RESOLVE_HOST:
  case CURLE_COULDNT_RESOLVE_PROXY:
  case CURLE_COULDNT_CONNECT:
  case CURLE_SEND_ERROR:
  case CURLE_RECV_ERROR:
  case CURLE_GOT_NOTHING:
  case CURLE_PARTIAL_FILE:
    return HttpErrorCode::NETWORK_ERROR;
  case CURLE_OPERATION_TIMEDOUT:
    return HttpErrorCode::TIMEOUT;
  case CURLE_ABORTED_BY_CALLBACK:
    return HttpErrorCode::CANCELED;
  case CURLE_URL_MALFORMAT:
  case CURLE_UNSUPPORTED_PROTOCOL:
    return HttpErrorCode::CLIENT_ERROR;
  default:
    return HttpErrorCode::UNKNOWN;
  }
}

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // namespace

CurlStreamSource::CurlStreamSource(std::shared_ptr<fanout::core::ILogger> logger)
    : logger_(std::move(logger)) {}

bool CurlStreamSource::available() noexcept { return true; }

Result<StreamResponse, TaskError>
CurlStreamSource::stream(const StreamRequest &request,
                         const fanout::core::ChunkSink &sink,
                         const std::shared_ptr<fanout::core::CancelToken> &token) const {
  using Out = Result<StreamResponse, TaskError>;

  if (token) {
    if (auto st = token->check(); st.is_err()) {
      return Out::Err(st.error());
    }
  }

  EasyHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    return Out::Err(make_http_error(HttpErrorCode::UNKNOWN,
                                    "HTTP transfer could not be started.",
                                    "curl_easy_init() returned null"));
  }
  CURL *curl = handle.get();

  Transfer transfer;
  transfer.handle = curl;
  transfer.sink = &sink;
  transfer.token = token.get();

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // required with threads
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(request.connect_timeout.count()));

  if (!request.body.empty()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  HeaderList headers(nullptr, &curl_slist_free_all);
  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    curl_slist *appended = curl_slist_append(headers.get(), line.c_str());
    if (!appended) {
      return Out::Err(make_http_error(HttpErrorCode::UNKNOWN,
                                      "HTTP transfer could not be started.",
                                      "curl_slist_append() failed"));
    }
    headers.release();
    headers.reset(appended);
  }
  if (headers) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  }

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &xferinfo_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

  const auto started = std::chrono::steady_clock::now();
  const CURLcode res = curl_easy_perform(curl);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!transfer.status_known) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &transfer.status);
  }

  StreamResponse response;
  response.status_code = transfer.status;
  response.bytes_received = transfer.bytes;
  response.elapsed = elapsed;

  if (res == CURLE_WRITE_ERROR && transfer.stopped_by_consumer) {
    response.stopped_by_consumer = true;
    return Out::Ok(response);
  }

  if (res != CURLE_OK) {
    const HttpErrorCode code = classify_curl_error(res);
    if (code == HttpErrorCode::CANCELED && token && token->is_cancelled()) {
      // Keep the token's reason (deadline vs. caller cancel).
      TaskError cancelled = token->check().error();
      cancelled.details["url"] = request.url;
      return Out::Err(std::move(cancelled));
    }
    TaskError err = make_http_error(
        code, "HTTP transfer failed.",
        std::string("CURL error: ") + curl_easy_strerror(res) +
            " (code: " + std::to_string(static_cast<int>(res)) + ")");
    err.details["url"] = request.url;
    if (logger_) {
      logger_->warn(request.trace_id, "curl_stream", "transfer_failed",
                    "url=" + request.url + " error=" + to_string(code) +
                        " curl=" + curl_easy_strerror(res));
    }
    return Out::Err(std::move(err));
  }

  if (auto status_error = classify_http_status(transfer.status)) {
    TaskError err = make_http_error(
        *status_error, "HTTP " + std::to_string(transfer.status) + " response",
        transfer.error_body);
    err.details["url"] = request.url;
    err.details["http_status"] = std::to_string(transfer.status);
    return Out::Err(std::move(err));
  }

  if (logger_) {
    logger_->info(request.trace_id, "curl_stream", "transfer_complete",
                  "url=" + request.url +
                      " status=" + std::to_string(transfer.status) +
                      " bytes=" + std::to_string(transfer.bytes) +
                      " elapsed_ms=" + std::to_string(elapsed.count()));
  }
  return Out::Ok(response);
}

} // namespace fanout::infra
