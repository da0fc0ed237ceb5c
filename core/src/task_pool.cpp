#include "core/task_pool.h"

#include "core/logger.h"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace fanout::core {
namespace {

/// Which item occupies a concurrency slot, and the token it runs on.
struct PoolSlot {
  std::size_t index = 0;
  std::shared_ptr<CancelToken> token;
};

/// Bookkeeping shared by the slot threads of one dispatch() call.
/// Owned through shared_ptr so a late cancel callback never outlives it.
struct DispatchState {
  std::mutex mutex;
  std::size_t next = 0;
  std::vector<PoolSlot> in_flight;
  std::size_t max_in_flight = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;

  // Serializes progress reporting so counts are delivered in order.
  std::mutex progress_mutex;
  std::size_t completed = 0;
};

std::string describe_in_flight(const std::vector<PoolSlot> &slots) {
  std::ostringstream os;
  os << '[';
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (i > 0) {
      os << ',';
    }
    os << slots[i].index;
  }
  os << ']';
  return os.str();
}

} // namespace

TaskPool::TaskPool(PoolOptions options, std::shared_ptr<ILogger> logger,
                   std::string trace_id)
    : options_(options), logger_(std::move(logger)),
      trace_id_(std::move(trace_id)) {}

Result<void, TaskError>
TaskPool::dispatch(std::size_t total, const StartFn &start, const SkipFn &skip,
                   const std::shared_ptr<CancelToken> &token,
                   const ProgressCallback &on_progress) const {
  if (options_.concurrency < 1) {
    return Result<void, TaskError>::Err(TaskError(
        ErrorKind::Permanent, error_code::kInvalidConcurrency,
        "concurrency must be >= 1",
        {{"concurrency", std::to_string(options_.concurrency)}}));
  }
  if (total == 0) {
    return Result<void, TaskError>::Ok();
  }

  const auto run_token = token ? token : CancelToken::create();
  const auto slot_count = std::min<std::size_t>(
      static_cast<std::size_t>(options_.concurrency), total);
  auto state = std::make_shared<DispatchState>();

  if (logger_) {
    logger_->info(trace_id_, "task_pool", "run_start",
                  "items=" + std::to_string(total) +
                      " concurrency=" + std::to_string(options_.concurrency) +
                      " slots=" + std::to_string(slot_count));
  }

  const auto cancel_registration = run_token->on_cancel(
      [state, logger = logger_, trace_id = trace_id_, run_token_weak =
           std::weak_ptr<CancelToken>(run_token)]() {
        if (!logger) {
          return;
        }
        std::string in_flight;
        std::size_t remaining = 0;
        {
          std::lock_guard<std::mutex> lock(state->mutex);
          in_flight = describe_in_flight(state->in_flight);
          remaining = state->next;
        }
        auto t = run_token_weak.lock();
        logger->warn(trace_id, "task_pool", "run_cancelled",
                     "reason=" + (t ? t->reason() : std::string("?")) +
                         " started=" + std::to_string(remaining) +
                         " in_flight=" + in_flight);
      });

  auto report = [&](const std::optional<TaskError> &failure, bool skipped) {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (skipped) {
        state->skipped++;
      } else if (failure.has_value()) {
        state->failed++;
      } else {
        state->succeeded++;
      }
    }
    std::lock_guard<std::mutex> progress_lock(state->progress_mutex);
    state->completed++;
    if (on_progress) {
      on_progress(state->completed, total);
    }
  };

  auto slot_loop = [&]() {
    while (true) {
      std::size_t index = 0;
      bool cancelled = false;
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->next >= total) {
          return;
        }
        index = state->next++;
        cancelled = run_token->is_cancelled();
      }

      if (cancelled) {
        TaskError err = run_token->check().error();
        err.details["index"] = std::to_string(index);
        skip(index, err);
        report(err, /*skipped=*/true);
        continue;
      }

      // Each item runs on its own child token so a per-item deadline never
      // leaks into its siblings.
      std::unique_ptr<Deadline> deadline;
      std::shared_ptr<CancelToken> slot_token;
      if (options_.item_timeout.count() > 0) {
        deadline = std::make_unique<Deadline>(run_token, options_.item_timeout);
        slot_token = deadline->token();
      } else {
        slot_token = CancelToken::derive_child(run_token);
      }

      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->in_flight.push_back(PoolSlot{index, slot_token});
        state->max_in_flight =
            std::max(state->max_in_flight, state->in_flight.size());
      }

      std::optional<TaskError> failure = start(index, slot_token);
      deadline.reset();

      {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto &slots = state->in_flight;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [index](const PoolSlot &s) {
                                     return s.index == index;
                                   }),
                    slots.end());
      }

      if (failure.has_value() && logger_) {
        logger_->warn(trace_id_, "task_pool", "item_failed",
                      "index=" + std::to_string(index) +
                          " kind=" + to_string(failure->kind) +
                          " code=" + std::to_string(failure->code) +
                          " error=" + failure->message);
      }
      report(failure, /*skipped=*/false);
    }
  };

  // A failed spawn leaves fewer slots; the slots already running drain the
  // remaining items. With no slot at all the calling thread runs the loop.
  std::vector<std::thread> workers;
  workers.reserve(slot_count);
  for (std::size_t i = 0; i < slot_count; ++i) {
    try {
      workers.emplace_back(slot_loop);
    } catch (const std::system_error &e) {
      if (logger_) {
        logger_->warn(trace_id_, "task_pool", "slot_spawn_failed",
                      "started=" + std::to_string(workers.size()) +
                          " wanted=" + std::to_string(slot_count) +
                          " error=" + e.what());
      }
      break;
    }
  }
  if (workers.empty()) {
    slot_loop();
  }
  for (auto &w : workers) {
    w.join();
  }

  run_token->remove_callback(cancel_registration);

  if (logger_) {
    logger_->info(trace_id_, "task_pool", "run_finished",
                  "succeeded=" + std::to_string(state->succeeded) +
                      " failed=" + std::to_string(state->failed) +
                      " cancelled_before_start=" +
                      std::to_string(state->skipped) +
                      " max_in_flight=" + std::to_string(state->max_in_flight));
  }
  return Result<void, TaskError>::Ok();
}

} // namespace fanout::core
