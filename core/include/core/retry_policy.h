#pragma once

#include "core/cancel_token.h"
#include "core/logger.h"
#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace fanout::core {

/// Retry configuration. Attempts count the first try.
struct RetryConfig {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{5000};
  double jitter_ratio = 0.25; // delay scaled by a factor in [1-r, 1+r]
};

struct RetryDecision {
  enum class Action { Retry, GiveUp };

  Action action = Action::GiveUp;
  std::chrono::milliseconds delay{0};

  static RetryDecision Retry(std::chrono::milliseconds d) {
    return {Action::Retry, d};
  }
  static RetryDecision GiveUp() { return {Action::GiveUp, {}}; }

  [[nodiscard]] bool should_retry() const noexcept {
    return action == Action::Retry;
  }
};

/// Pure retry decision: no state is carried between calls. Only Transient
/// errors are retried; Permanent, Cancelled and Malformed give up on the
/// first attempt regardless of the remaining budget.
class RetryPolicy {
public:
  /// Uniform sample in [0, 1). Injected so tests can pin the jitter.
  using JitterSource = std::function<double()>;

  explicit RetryPolicy(RetryConfig config = {}, JitterSource jitter = {});

  /// `attempt` is 1-based: the number of attempts already made.
  [[nodiscard]] RetryDecision decide(const TaskError &error, int attempt) const;

  /// Backoff before attempt `attempt + 1`, jitter applied, capped.
  [[nodiscard]] std::chrono::milliseconds backoff_for(int attempt) const;

  [[nodiscard]] const RetryConfig &config() const noexcept { return config_; }

  [[nodiscard]] static bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::Transient;
  }

private:
  RetryConfig config_;
  JitterSource jitter_;
};

/// Final result of a retried unit plus how many attempts were made.
template <typename T> struct AttemptResult {
  Result<T, TaskError> result;
  int attempts = 0;
};

/// Logging context for run_with_retry.
struct RetryContext {
  std::shared_ptr<ILogger> logger;
  std::string trace_id;
  std::string label; // e.g. "item=3"
};

/// Run one attempt; an exception counts as a Permanent failure (kUnitThrew).
template <typename T, typename Fn>
Result<T, TaskError> invoke_attempt(Fn &attempt) {
  try {
    return attempt();
  } catch (const std::exception &e) {
    return Result<T, TaskError>::Err(
        TaskError(ErrorKind::Permanent, error_code::kUnitThrew,
                  std::string("unit of work threw: ") + e.what()));
  } catch (...) {
    return Result<T, TaskError>::Err(
        TaskError(ErrorKind::Permanent, error_code::kUnitThrew,
                  "unit of work threw a non-standard exception"));
  }
}

/// Run `attempt` (callable returning Result<T, TaskError>) under `policy`.
///
/// Returns the first success, or the LAST observed error once the policy
/// gives up. Cancellation wins over a pending retry: if `token` is cancelled
/// before the first attempt, when a retry is due, or during the backoff wait,
/// the result is Cancelled (details["last_error"] keeps the prior failure).
template <typename T, typename Fn>
AttemptResult<T> run_with_retry(const RetryPolicy &policy, Fn &&attempt,
                                const std::shared_ptr<CancelToken> &token,
                                const RetryContext &ctx = {}) {
  using R = Result<T, TaskError>;

  if (token) {
    if (auto st = token->check(); st.is_err()) {
      return {R::Err(st.error()), 0};
    }
  }

  int attempts = 0;
  while (true) {
    R result = invoke_attempt<T>(attempt);
    ++attempts;
    if (result.is_ok()) {
      return {std::move(result), attempts};
    }

    TaskError error = std::move(result).error();
    error.details["attempts"] = std::to_string(attempts);

    const RetryDecision decision = policy.decide(error, attempts);
    if (!decision.should_retry()) {
      return {R::Err(std::move(error)), attempts};
    }

    auto cancelled_instead = [&]() {
      TaskError cancelled = token->check().error();
      cancelled.details["attempts"] = std::to_string(attempts);
      cancelled.details["last_error"] = error.message;
      return AttemptResult<T>{R::Err(std::move(cancelled)), attempts};
    };

    if (token && token->is_cancelled()) {
      return cancelled_instead();
    }

    if (ctx.logger) {
      ctx.logger->warn(ctx.trace_id, "retry", "retry_scheduled",
                       ctx.label + " attempt=" + std::to_string(attempts) +
                           " max_attempts=" +
                           std::to_string(policy.config().max_attempts) +
                           " backoff_ms=" +
                           std::to_string(decision.delay.count()) +
                           " error=" + error.message);
    }

    if (token) {
      if (token->wait_for(decision.delay)) {
        return cancelled_instead();
      }
    } else {
      std::this_thread::sleep_for(decision.delay);
    }
  }
}

} // namespace fanout::core
