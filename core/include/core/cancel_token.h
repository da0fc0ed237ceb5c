#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fanout::core {

/// Reason recorded by Deadline when its timer fires.
inline constexpr const char *kDeadlineReason = "deadline exceeded";

/// Thread-safe, one-way cancellation token.
///
/// Active -> Cancelled is terminal. The first cancel() records the reason and
/// runs every registered callback exactly once, outside the internal lock, on
/// the cancelling thread. Tokens are always held through shared_ptr so that a
/// scheduler, its slots and the units they run can share one signal.
///
/// Usage in a unit of work:
///   for (const auto &part : parts) {
///     if (auto st = token->check(); st.is_err()) {
///       return Result<Out, TaskError>::Err(st.error());
///     }
///     ...
///   }
class CancelToken {
public:
  using Callback = std::function<void()>;
  using CallbackId = std::uint64_t;

  /// Returned by on_cancel() when the callback already ran.
  static constexpr CallbackId kAlreadyInvoked = 0;

  CancelToken() = default;
  ~CancelToken();

  CancelToken(const CancelToken &) = delete;
  CancelToken &operator=(const CancelToken &) = delete;

  /// Request cancellation. Idempotent; only the first reason is kept.
  /// Callbacks must not throw.
  void cancel(std::string reason = "cancelled");

  [[nodiscard]] bool is_cancelled() const noexcept;

  /// Reason given to the first cancel(); empty while active.
  [[nodiscard]] std::string reason() const;

  /// Err(Cancelled) once cancelled. Deadline expiry maps to
  /// error_code::kDeadlineExceeded.
  [[nodiscard]] Result<void, TaskError> check() const;

  /// Register a callback invoked at most once. Runs immediately, on the
  /// calling thread, if the token is already cancelled.
  CallbackId on_cancel(Callback cb);

  /// Drop a registration. No-op for unknown ids or after cancellation.
  void remove_callback(CallbackId id);

  /// Block for up to `timeout`. Returns true as soon as the token is
  /// cancelled, false if the full timeout elapsed while still active.
  bool wait_for(std::chrono::milliseconds timeout) const;

  static std::shared_ptr<CancelToken> create();

  /// Child cancels when the parent does (with the parent's reason);
  /// cancelling the child never touches the parent. A null parent yields a
  /// plain root token.
  static std::shared_ptr<CancelToken>
  derive_child(const std::shared_ptr<CancelToken> &parent);

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::string reason_;
  CallbackId next_id_ = 1;
  std::vector<std::pair<CallbackId, Callback>> callbacks_;

  // Registration held on the parent, removed when this child dies.
  std::weak_ptr<CancelToken> parent_;
  CallbackId parent_registration_ = kAlreadyInvoked;
};

/// RAII timeout: owns a child token of `parent` that cancels itself with
/// kDeadlineReason once `timeout` elapses. Destroying the Deadline stops the
/// timer without cancelling the token.
class Deadline {
public:
  Deadline(const std::shared_ptr<CancelToken> &parent,
           std::chrono::milliseconds timeout);
  ~Deadline();

  Deadline(const Deadline &) = delete;
  Deadline &operator=(const Deadline &) = delete;

  [[nodiscard]] const std::shared_ptr<CancelToken> &token() const noexcept {
    return token_;
  }

  /// True if the timer fired (as opposed to the parent cancelling).
  [[nodiscard]] bool expired() const noexcept {
    return expired_.load(std::memory_order_acquire);
  }

private:
  std::shared_ptr<CancelToken> token_;
  std::shared_ptr<CancelToken> stop_;
  std::atomic<bool> expired_{false};
  std::thread timer_;
};

} // namespace fanout::core
