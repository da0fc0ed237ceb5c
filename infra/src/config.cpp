#include "infra/config.h"

#include "infra/payload_check.h"

#include <charconv>
#include <cstdlib>
#include <utility>

namespace fanout::infra {

using fanout::core::ErrorKind;
using fanout::core::Result;
using fanout::core::TaskError;

namespace {

std::optional<std::string> process_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

TaskError invalid_value(const std::string &name, const std::string &value,
                        const std::string &expected) {
  return TaskError(ErrorKind::Permanent, 0,
                   "Invalid value for " + name + ": expected " + expected,
                   {{"variable", name}, {"value", value}});
}

/// Parse an integer variable into `out` if set; Err if malformed or < min.
Result<void, TaskError> read_int(const FetchConfig::EnvLookup &lookup,
                                 const std::string &name, int min, int &out) {
  const auto raw = lookup(name);
  if (!raw.has_value() || raw->empty()) {
    return Result<void, TaskError>::Ok();
  }
  int parsed = 0;
  const std::string &value = *raw;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || parsed < min) {
    return Result<void, TaskError>::Err(invalid_value(
        name, value, "integer >= " + std::to_string(min)));
  }
  out = parsed;
  return Result<void, TaskError>::Ok();
}

/// Parse a 0/1/true/false variable into `out` if set.
Result<void, TaskError> read_bool(const FetchConfig::EnvLookup &lookup,
                                  const std::string &name, bool &out) {
  const auto raw = lookup(name);
  if (!raw.has_value() || raw->empty()) {
    return Result<void, TaskError>::Ok();
  }
  if (*raw == "1" || *raw == "true") {
    out = true;
  } else if (*raw == "0" || *raw == "false") {
    out = false;
  } else {
    return Result<void, TaskError>::Err(
        invalid_value(name, *raw, "0, 1, true or false"));
  }
  return Result<void, TaskError>::Ok();
}

} // namespace

Result<FetchConfig, TaskError>
FetchConfig::from_environment(const EnvLookup &lookup) {
  const EnvLookup env = lookup ? lookup : EnvLookup(process_env);
  FetchConfig config;

  struct IntField {
    const char *name;
    int min;
    int *target;
  };
  const IntField int_fields[] = {
      {"FANOUT_CONCURRENCY", 1, &config.concurrency},
      {"FANOUT_MAX_ATTEMPTS", 1, &config.max_attempts},
      {"FANOUT_INITIAL_BACKOFF_MS", 0, &config.initial_backoff_ms},
      {"FANOUT_MAX_BACKOFF_MS", 0, &config.max_backoff_ms},
      {"FANOUT_REQUEST_TIMEOUT_MS", 1, &config.request_timeout_ms},
      {"FANOUT_RUN_TIMEOUT_MS", 0, &config.run_timeout_ms},
  };
  for (const auto &field : int_fields) {
    auto read = read_int(env, field.name, field.min, *field.target);
    if (read.is_err()) {
      return Result<FetchConfig, TaskError>::Err(read.error());
    }
  }

  struct BoolField {
    const char *name;
    bool *target;
  };
  const BoolField bool_fields[] = {
      {"FANOUT_FAIL_FAST", &config.fail_fast},
      {"FANOUT_VALIDATE_JSON", &config.validate_json},
  };
  for (const auto &field : bool_fields) {
    auto read = read_bool(env, field.name, *field.target);
    if (read.is_err()) {
      return Result<FetchConfig, TaskError>::Err(read.error());
    }
  }

  if (const auto mode = env("FANOUT_DECODE_MODE"); mode.has_value()) {
    if (*mode == "lines") {
      config.decode_mode = fanout::core::DecodeMode::Line;
    } else if (*mode == "events") {
      config.decode_mode = fanout::core::DecodeMode::Event;
    } else {
      return Result<FetchConfig, TaskError>::Err(
          invalid_value("FANOUT_DECODE_MODE", *mode, "lines or events"));
    }
  }

  if (const auto sentinel = env("FANOUT_SENTINEL"); sentinel.has_value()) {
    config.sentinel = *sentinel;
  }
  if (const auto level = env("FANOUT_LOG_LEVEL"); level.has_value()) {
    config.log_level = parse_log_level(*level);
  }

  return Result<FetchConfig, TaskError>::Ok(std::move(config));
}

fanout::core::OrchestratorConfig FetchConfig::to_orchestrator_config() const {
  fanout::core::OrchestratorConfig out;
  out.pool.concurrency = concurrency;
  out.retry.max_attempts = max_attempts;
  out.retry.initial_backoff = std::chrono::milliseconds(initial_backoff_ms);
  out.retry.max_backoff = std::chrono::milliseconds(max_backoff_ms);
  out.run_timeout = std::chrono::milliseconds(run_timeout_ms);
  out.fail_fast = fail_fast;
  return out;
}

fanout::core::DecoderConfig FetchConfig::to_decoder_config() const {
  fanout::core::DecoderConfig out;
  out.mode = decode_mode;
  out.sentinel = sentinel;
  if (validate_json && decode_mode == fanout::core::DecodeMode::Event) {
    out.payload_validator = [](const std::string &payload) {
      return looks_like_json_document(payload);
    };
  }
  return out;
}

} // namespace fanout::infra
