#include "core/orchestrator.h"

#include "core/logger.h"

#include <cstdint>
#include <random>
#include <sstream>

namespace fanout::core {

Orchestrator::Orchestrator(OrchestratorConfig config,
                           std::shared_ptr<ILogger> logger)
    : config_(std::move(config)), retry_(config_.retry),
      logger_(std::move(logger)) {}

Orchestrator::RunScope
Orchestrator::open_scope(const std::shared_ptr<CancelToken> &external,
                         std::size_t items, const char *kind) const {
  RunScope scope;
  scope.trace_id = generate_trace_id();

  // The root is always a child, so fail-fast or a batch deadline never
  // cancels the caller's own token.
  if (config_.run_timeout.count() > 0) {
    scope.deadline = std::make_unique<Deadline>(external, config_.run_timeout);
    scope.root = scope.deadline->token();
  } else {
    scope.root = CancelToken::derive_child(external);
  }

  if (logger_) {
    logger_->info(scope.trace_id, "orchestrator", "run_start",
                  std::string("kind=") + kind +
                      " items=" + std::to_string(items) +
                      " concurrency=" + std::to_string(config_.pool.concurrency) +
                      " max_attempts=" +
                      std::to_string(retry_.config().max_attempts) +
                      " run_timeout_ms=" +
                      std::to_string(config_.run_timeout.count()) +
                      " fail_fast=" + (config_.fail_fast ? "true" : "false"));
  }
  return scope;
}

void Orchestrator::close_scope(const RunScope &scope,
                               const std::string &status) const {
  if (!logger_) {
    return;
  }
  if (scope.deadline && scope.deadline->expired()) {
    logger_->warn(scope.trace_id, "orchestrator", "run_deadline_exceeded",
                  "run_timeout_ms=" +
                      std::to_string(config_.run_timeout.count()));
  }
  logger_->info(scope.trace_id, "orchestrator", "run_finished",
                "status=" + status + " cancelled=" +
                    (scope.root->is_cancelled() ? "true" : "false"));
}

void Orchestrator::trip_fail_fast(const RunScope &scope,
                                  const TaskError &error) const {
  if (!config_.fail_fast || error.is_cancelled()) {
    return;
  }
  if (logger_ && !scope.root->is_cancelled()) {
    logger_->warn(scope.trace_id, "orchestrator", "fail_fast",
                  std::string("kind=") + to_string(error.kind) +
                      " error=" + error.message);
  }
  scope.root->cancel("fail-fast: " + error.message);
}

void Orchestrator::tally(StreamSummary &summary, const DecodedRecord &record) {
  summary.records++;
  switch (record.kind) {
  case RecordKind::Line:
    summary.lines++;
    break;
  case RecordKind::Event:
    summary.events++;
    break;
  case RecordKind::Malformed:
    summary.malformed++;
    break;
  case RecordKind::EndOfStream:
    summary.reached_end = true;
    break;
  }
}

TaskError Orchestrator::stream_stopped(std::size_t index) {
  return TaskError(ErrorKind::Cancelled, error_code::kStreamStopped,
                   "record sink stopped the stream",
                   {{"index", std::to_string(index)}});
}

std::string Orchestrator::generate_trace_id() {
  static thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dis;

  std::stringstream ss;
  ss << std::hex;
  ss << dis(gen);
  ss << "-";
  ss << (dis(gen) & 0xFFFF);
  ss << "-4"; // Version 4
  ss << (dis(gen) & 0x0FFF);
  ss << "-";
  ss << ((dis(gen) & 0x3FFF) | 0x8000);
  ss << "-";
  ss << (dis(gen) & 0xFFFF);
  ss << (dis(gen) & 0xFFFF);
  ss << (dis(gen) & 0xFFFF);
  return ss.str();
}

} // namespace fanout::core
