#include "core/retry_policy.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace fanout::core {
namespace {

double default_jitter() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng);
}

RetryConfig normalize_config(RetryConfig config) {
  config.max_attempts = std::max(1, config.max_attempts);
  if (config.initial_backoff.count() < 0) {
    config.initial_backoff = std::chrono::milliseconds(0);
  }
  if (config.max_backoff < config.initial_backoff) {
    config.max_backoff = config.initial_backoff;
  }
  if (config.backoff_multiplier < 1.0) {
    config.backoff_multiplier = 1.0;
  }
  config.jitter_ratio = std::clamp(config.jitter_ratio, 0.0, 1.0);
  return config;
}

} // namespace

RetryPolicy::RetryPolicy(RetryConfig config, JitterSource jitter)
    : config_(normalize_config(std::move(config))),
      jitter_(jitter ? std::move(jitter) : JitterSource(default_jitter)) {}

RetryDecision RetryPolicy::decide(const TaskError &error, int attempt) const {
  if (!is_retryable(error.kind)) {
    return RetryDecision::GiveUp();
  }
  const int made = std::max(1, attempt);
  if (made >= config_.max_attempts) {
    return RetryDecision::GiveUp();
  }
  return RetryDecision::Retry(backoff_for(made));
}

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
  const int exponent = std::max(1, attempt) - 1;
  const double cap = static_cast<double>(config_.max_backoff.count());
  double base = static_cast<double>(config_.initial_backoff.count()) *
                std::pow(config_.backoff_multiplier, exponent);
  base = std::min(base, cap);

  double factor = 1.0;
  if (config_.jitter_ratio > 0.0) {
    const double u = std::clamp(jitter_(), 0.0, 1.0);
    factor = 1.0 + config_.jitter_ratio * (2.0 * u - 1.0);
  }

  const double delay = std::clamp(base * factor, 0.0, cap);
  return std::chrono::milliseconds(static_cast<long long>(std::llround(delay)));
}

} // namespace fanout::core
