#pragma once

#include "core/cancel_token.h"
#include "core/frame_decoder.h"
#include "core/result.h"
#include "core/retry_policy.h"
#include "core/task_error.h"
#include "core/task_pool.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <numeric>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fanout::core {

class ILogger;

struct OrchestratorConfig {
  PoolOptions pool;
  RetryConfig retry;
  std::chrono::milliseconds run_timeout{0}; // 0 = no deadline for the batch
  bool fail_fast = false; // first failed item cancels the rest of the batch
};

/// Per-stream tally returned as the value of a successful streaming item.
struct StreamSummary {
  std::size_t records = 0;
  std::size_t lines = 0;
  std::size_t events = 0;
  std::size_t malformed = 0;
  bool reached_end = false;
};

/// Receives raw chunks from a streaming unit. Returning false asks the
/// producer to stop reading; that is not an error for the producer.
using ChunkSink = std::function<bool(std::string_view chunk)>;

/// Unit of work that produces a byte stream instead of a value.
template <typename I>
using StreamUnit = std::function<Result<void, TaskError>(
    const I &, const ChunkSink &, const std::shared_ptr<CancelToken> &)>;

/// Receives decoded records as they complete. Returning false stops that
/// stream; the item then finishes as Cancelled (kStreamStopped).
using RecordSink =
    std::function<bool(std::size_t index, const DecodedRecord &record)>;

/// Composition root for a batch.
///
/// Responsibilities:
///   1. Build the root token for the run: a child of the caller's token
///      (if any), under a deadline when run_timeout is set
///   2. Wrap the unit with the retry policy
///   3. Hand the wrapped unit to a TaskPool
///   4. For streaming units, own one FrameDecoder per stream attempt and
///      flush it when the stream ends
///
/// Holds only its configuration and logger; everything else is per run.
class Orchestrator {
public:
  explicit Orchestrator(OrchestratorConfig config,
                        std::shared_ptr<ILogger> logger = nullptr);

  [[nodiscard]] const OrchestratorConfig &config() const noexcept {
    return config_;
  }

  template <typename I, typename O>
  Result<std::vector<TaskOutcome<O>>, TaskError>
  run(std::vector<I> inputs, const UnitOfWork<I, O> &unit,
      const std::shared_ptr<CancelToken> &external = nullptr,
      const ProgressCallback &on_progress = {}) const {
    if (!unit) {
      return Result<std::vector<TaskOutcome<O>>, TaskError>::Err(
          TaskError(ErrorKind::Permanent, error_code::kNullUnit,
                    "unit of work must not be empty"));
    }
    RunScope scope = open_scope(external, inputs.size(), "batch");

    std::vector<std::size_t> positions(inputs.size());
    std::iota(positions.begin(), positions.end(), std::size_t{0});

    AttemptedUnit<std::size_t, O> wrapped =
        [&](const std::size_t &index,
            const std::shared_ptr<CancelToken> &token) {
          const I &input = inputs[index];
          auto attempted = run_with_retry<O>(
              retry_, [&]() { return unit(input, token); }, token,
              RetryContext{logger_, scope.trace_id,
                           "item=" + std::to_string(index)});
          if (attempted.result.is_err()) {
            trip_fail_fast(scope, attempted.result.error());
          }
          return attempted;
        };

    TaskPool pool(config_.pool, logger_, scope.trace_id);
    auto result = pool.run_attempted<std::size_t, O>(
        make_work_items(std::move(positions)), wrapped, scope.root,
        on_progress);
    close_scope(scope, result.is_ok() ? std::string("ok")
                                      : result.error().message);
    return result;
  }

  template <typename I>
  Result<std::vector<TaskOutcome<StreamSummary>>, TaskError>
  run_streams(std::vector<I> inputs, const StreamUnit<I> &unit,
              const DecoderConfig &decoder_config, const RecordSink &sink,
              const std::shared_ptr<CancelToken> &external = nullptr,
              const ProgressCallback &on_progress = {}) const {
    using Out = Result<StreamSummary, TaskError>;
    if (!unit) {
      return Result<std::vector<TaskOutcome<StreamSummary>>, TaskError>::Err(
          TaskError(ErrorKind::Permanent, error_code::kNullUnit,
                    "stream unit must not be empty"));
    }
    RunScope scope = open_scope(external, inputs.size(), "streams");

    // Slots address inputs by position so records can be tagged with it.
    std::vector<std::size_t> positions(inputs.size());
    std::iota(positions.begin(), positions.end(), std::size_t{0});

    AttemptedUnit<std::size_t, StreamSummary> wrapped =
        [&](const std::size_t &index,
            const std::shared_ptr<CancelToken> &token) {
          const I &input = inputs[index];
          auto one_stream = [&]() -> Out {
            // Fresh decoder per attempt: a retried stream starts over.
            FrameDecoder decoder(decoder_config);
            StreamSummary summary;
            bool stopped = false;

            auto deliver = [&](const std::vector<DecodedRecord> &records) {
              for (const auto &record : records) {
                tally(summary, record);
                if (sink && !sink(index, record)) {
                  stopped = true;
                  return false;
                }
              }
              return true;
            };

            ChunkSink chunk_sink = [&](std::string_view chunk) {
              if (stopped) {
                return false;
              }
              return deliver(decoder.feed(chunk)) && !decoder.finished();
            };

            auto status = unit(input, chunk_sink, token);
            if (stopped) {
              return Out::Err(stream_stopped(index));
            }
            if (status.is_err()) {
              return Out::Err(status.error());
            }
            deliver(decoder.flush());
            if (stopped) {
              return Out::Err(stream_stopped(index));
            }
            return Out::Ok(summary);
          };

          auto attempted = run_with_retry<StreamSummary>(
              retry_, one_stream, token,
              RetryContext{logger_, scope.trace_id,
                           "item=" + std::to_string(index)});
          if (attempted.result.is_err()) {
            trip_fail_fast(scope, attempted.result.error());
          }
          return attempted;
        };

    TaskPool pool(config_.pool, logger_, scope.trace_id);
    auto result = pool.run_attempted<std::size_t, StreamSummary>(
        make_work_items(std::move(positions)), wrapped, scope.root,
        on_progress);
    close_scope(scope, result.is_ok() ? std::string("ok")
                                      : result.error().message);
    return result;
  }

private:
  /// Per-run state: trace id, root token, optional batch deadline.
  struct RunScope {
    std::string trace_id;
    std::shared_ptr<CancelToken> root;
    std::unique_ptr<Deadline> deadline;
  };

  RunScope open_scope(const std::shared_ptr<CancelToken> &external,
                      std::size_t items, const char *kind) const;
  void close_scope(const RunScope &scope, const std::string &status) const;
  void trip_fail_fast(const RunScope &scope, const TaskError &error) const;

  static void tally(StreamSummary &summary, const DecodedRecord &record);
  static TaskError stream_stopped(std::size_t index);
  static std::string generate_trace_id();

  OrchestratorConfig config_;
  RetryPolicy retry_;
  std::shared_ptr<ILogger> logger_;
};

} // namespace fanout::core
