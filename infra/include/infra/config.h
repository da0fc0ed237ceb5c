#pragma once

#include "core/frame_decoder.h"
#include "core/orchestrator.h"
#include "core/result.h"
#include "core/task_error.h"
#include "infra/logger.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace fanout::infra {

/// Settings for the fetch tool, read from FANOUT_* environment variables.
/// Core components never read the environment; this is converted into
/// explicit configs with to_orchestrator_config() / to_decoder_config().
struct FetchConfig {
  int concurrency = 4;
  int max_attempts = 3;
  int initial_backoff_ms = 200;
  int max_backoff_ms = 5000;
  int request_timeout_ms = 30000;
  int run_timeout_ms = 0; // 0 = no batch deadline
  bool fail_fast = false;
  fanout::core::DecodeMode decode_mode = fanout::core::DecodeMode::Line;
  std::string sentinel = "[DONE]";
  bool validate_json = false; // event payloads must be a JSON object/array
  LogLevel log_level = LogLevel::Info;

  /// Returns the value of a variable, nullopt when unset.
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string &name)>;

  /// Reads:
  ///   FANOUT_CONCURRENCY, FANOUT_MAX_ATTEMPTS, FANOUT_INITIAL_BACKOFF_MS,
  ///   FANOUT_MAX_BACKOFF_MS, FANOUT_REQUEST_TIMEOUT_MS, FANOUT_RUN_TIMEOUT_MS,
  ///   FANOUT_FAIL_FAST (0/1/true/false), FANOUT_DECODE_MODE (lines|events),
  ///   FANOUT_SENTINEL, FANOUT_VALIDATE_JSON (0/1/true/false),
  ///   FANOUT_LOG_LEVEL
  /// Unset or empty variables keep their defaults. A malformed value is an
  /// Err(Permanent) naming the variable.
  static fanout::core::Result<FetchConfig, fanout::core::TaskError>
  from_environment(const EnvLookup &lookup = {});

  [[nodiscard]] fanout::core::OrchestratorConfig to_orchestrator_config() const;
  [[nodiscard]] fanout::core::DecoderConfig to_decoder_config() const;
};

} // namespace fanout::infra
