#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/retry_policy.h"
#include "core/task_error.h"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fanout::core {

class ILogger;

// ---- Work model ----

/// Input value tagged with its position in the caller's batch.
template <typename I> struct WorkItem {
  std::size_t index = 0;
  I value;
};

template <typename I>
std::vector<WorkItem<I>> make_work_items(std::vector<I> values) {
  std::vector<WorkItem<I>> items;
  items.reserve(values.size());
  for (std::size_t i = 0; i < values.size(); ++i) {
    items.push_back(WorkItem<I>{i, std::move(values[i])});
  }
  return items;
}

/// The operation applied to one work item. Must observe `token` at its own
/// checkpoints; the pool never interrupts a running unit.
template <typename I, typename O>
using UnitOfWork = std::function<Result<O, TaskError>(
    const I &, const std::shared_ptr<CancelToken> &)>;

/// Unit that reports its own attempt count (used by the retry wrapper).
template <typename I, typename O>
using AttemptedUnit = std::function<AttemptResult<O>(
    const I &, const std::shared_ptr<CancelToken> &)>;

/// Exactly one per work item: Success{value} or Failure{error, attempts}.
template <typename O> class TaskOutcome {
public:
  static TaskOutcome Success(O value, int attempts = 1) {
    return TaskOutcome(Result<O, TaskError>::Ok(std::move(value)), attempts);
  }

  static TaskOutcome Failure(TaskError error, int attempts) {
    return TaskOutcome(Result<O, TaskError>::Err(std::move(error)), attempts);
  }

  [[nodiscard]] bool is_success() const noexcept { return result_.is_ok(); }
  [[nodiscard]] const O &value() const & { return result_.value(); }
  [[nodiscard]] const TaskError &error() const & { return result_.error(); }
  [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
  TaskOutcome(Result<O, TaskError> result, int attempts)
      : result_(std::move(result)), attempts_(attempts) {}

  Result<O, TaskError> result_;
  int attempts_;
};

/// Progress notification: completed in [1, total], strictly increasing.
/// Called from slot threads; must not throw.
using ProgressCallback =
    std::function<void(std::size_t completed, std::size_t total)>;

struct PoolOptions {
  int concurrency = 4;                       // must be >= 1
  std::chrono::milliseconds item_timeout{0}; // 0 = no per-item deadline
};

/// Bounded-concurrency scheduler.
///
/// run() keeps at most `concurrency` units in flight. Each slot pulls the next
/// not-yet-started item in input order as soon as its previous item
/// completed and progress was reported. Outcomes come back indexed by input
/// position regardless of completion order. A per-item failure never aborts
/// siblings; run() itself only fails for programmer errors
/// (concurrency < 1, null unit).
///
/// Cancelling `token` stops new starts: every item not yet started is
/// recorded as Failure{Cancelled, attempts 0} without invoking the unit.
/// Units already running see the cancellation through their own child token.
class TaskPool {
public:
  explicit TaskPool(PoolOptions options, std::shared_ptr<ILogger> logger = nullptr,
                    std::string trace_id = "-");

  [[nodiscard]] const PoolOptions &options() const noexcept { return options_; }

  template <typename I, typename O>
  Result<std::vector<TaskOutcome<O>>, TaskError>
  run(const std::vector<WorkItem<I>> &items, const UnitOfWork<I, O> &unit,
      const std::shared_ptr<CancelToken> &token,
      const ProgressCallback &on_progress = {}) const {
    if (!unit) {
      return Result<std::vector<TaskOutcome<O>>, TaskError>::Err(
          TaskError(ErrorKind::Permanent, error_code::kNullUnit,
                    "unit of work must not be empty"));
    }
    AttemptedUnit<I, O> once = [&unit](const I &input,
                                       const std::shared_ptr<CancelToken> &t) {
      return AttemptResult<O>{unit(input, t), 1};
    };
    return run_attempted<I, O>(items, once, token, on_progress);
  }

  template <typename I, typename O>
  Result<std::vector<TaskOutcome<O>>, TaskError>
  run_attempted(const std::vector<WorkItem<I>> &items,
                const AttemptedUnit<I, O> &unit,
                const std::shared_ptr<CancelToken> &token,
                const ProgressCallback &on_progress = {}) const {
    using Out = Result<std::vector<TaskOutcome<O>>, TaskError>;
    if (!unit) {
      return Out::Err(TaskError(ErrorKind::Permanent, error_code::kNullUnit,
                                "unit of work must not be empty"));
    }

    // Each index is written by exactly one slot; dispatch() joins all slots
    // before returning, which publishes the writes.
    std::vector<std::optional<TaskOutcome<O>>> slots(items.size());

    StartFn start = [&](std::size_t index,
                        const std::shared_ptr<CancelToken> &slot_token)
        -> std::optional<TaskError> {
      AttemptResult<O> attempted = invoke_guarded(unit, items[index].value,
                                                  slot_token);
      if (attempted.result.is_ok()) {
        slots[index] = TaskOutcome<O>::Success(
            std::move(attempted.result).value(), attempted.attempts);
        return std::nullopt;
      }
      TaskError err = attempted.result.error();
      slots[index] = TaskOutcome<O>::Failure(std::move(attempted.result).error(),
                                             attempted.attempts);
      return err;
    };

    SkipFn skip = [&](std::size_t index, const TaskError &cancelled) {
      slots[index] = TaskOutcome<O>::Failure(cancelled, 0);
    };

    auto dispatched = dispatch(items.size(), start, skip, token, on_progress);
    if (dispatched.is_err()) {
      return Out::Err(dispatched.error());
    }

    std::vector<TaskOutcome<O>> outcomes;
    outcomes.reserve(slots.size());
    for (auto &slot : slots) {
      outcomes.push_back(std::move(*slot));
    }
    return Out::Ok(std::move(outcomes));
  }

private:
  /// Runs item `index` on `slot_token`; returns the failure, if any.
  using StartFn = std::function<std::optional<TaskError>(
      std::size_t index, const std::shared_ptr<CancelToken> &slot_token)>;
  /// Records item `index` as cancelled before start.
  using SkipFn =
      std::function<void(std::size_t index, const TaskError &cancelled)>;

  Result<void, TaskError> dispatch(std::size_t total, const StartFn &start,
                                   const SkipFn &skip,
                                   const std::shared_ptr<CancelToken> &token,
                                   const ProgressCallback &on_progress) const;

  template <typename I, typename O>
  static AttemptResult<O>
  invoke_guarded(const AttemptedUnit<I, O> &unit, const I &input,
                 const std::shared_ptr<CancelToken> &token) {
    try {
      return unit(input, token);
    } catch (const std::exception &e) {
      return AttemptResult<O>{
          Result<O, TaskError>::Err(TaskError(
              ErrorKind::Permanent, error_code::kUnitThrew,
              std::string("unit of work threw: ") + e.what())),
          1};
    } catch (...) {
      return AttemptResult<O>{
          Result<O, TaskError>::Err(TaskError(
              ErrorKind::Permanent, error_code::kUnitThrew,
              "unit of work threw a non-standard exception")),
          1};
    }
  }

  PoolOptions options_;
  std::shared_ptr<ILogger> logger_;
  std::string trace_id_;
};

} // namespace fanout::core
