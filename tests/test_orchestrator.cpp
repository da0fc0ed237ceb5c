#include <gtest/gtest.h>

#include "core/logger.h"
#include "core/orchestrator.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace fanout::core;
using namespace std::chrono_literals;

namespace {

/// Captures log events so tests can assert what the orchestrator reported.
class RecordingLogger : public ILogger {
public:
  void info(const std::string &, const std::string &component,
            const std::string &event, const std::string &msg) override {
    record(component, event, msg);
  }
  void warn(const std::string &, const std::string &component,
            const std::string &event, const std::string &msg) override {
    record(component, event, msg);
  }
  void error(const std::string &, const std::string &component,
             const std::string &event, const std::string &msg) override {
    record(component, event, msg);
  }

  bool saw(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &e : events_) {
      if (e.first == event) {
        return true;
      }
    }
    return false;
  }

  /// Messages logged for `event`, in order.
  std::vector<std::string> messages(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    for (const auto &e : events_) {
      if (e.first == event) {
        out.push_back(e.second);
      }
    }
    return out;
  }

private:
  void record(const std::string &component, const std::string &event,
              const std::string &msg) {
    std::lock_guard<std::mutex> lock(mu_);
    events_.emplace_back(component + "/" + event, msg);
  }

  mutable std::mutex mu_;
  std::vector<std::pair<std::string, std::string>> events_;
};

OrchestratorConfig quick_config(int concurrency, int max_attempts = 3) {
  OrchestratorConfig cfg;
  cfg.pool.concurrency = concurrency;
  cfg.retry.max_attempts = max_attempts;
  cfg.retry.initial_backoff = 1ms;
  cfg.retry.max_backoff = 2ms;
  cfg.retry.jitter_ratio = 0.0;
  return cfg;
}

std::vector<int> range(int n) {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) {
    v.push_back(i);
  }
  return v;
}

/// Fake stream source: each input is the list of chunks to deliver.
using Chunks = std::vector<std::string>;

StreamUnit<Chunks> replay_unit() {
  return [](const Chunks &chunks, const ChunkSink &sink,
            const std::shared_ptr<CancelToken> &token) {
    for (const auto &chunk : chunks) {
      if (auto st = token->check(); st.is_err()) {
        return Result<void, TaskError>::Err(st.error());
      }
      if (!sink(chunk)) {
        break;
      }
    }
    return Result<void, TaskError>::Ok();
  };
}

DecoderConfig events() {
  DecoderConfig cfg;
  cfg.mode = DecodeMode::Event;
  return cfg;
}

} // namespace

TEST(Orchestrator, TenInstantItemsKeepOrderAndReportProgress) {
  Orchestrator orchestrator(quick_config(3));
  std::vector<std::pair<std::size_t, std::size_t>> progress;
  std::mutex mu;

  UnitOfWork<int, std::string> unit = [](const int &v, const auto &) {
    return Result<std::string, TaskError>::Ok("item-" + std::to_string(v));
  };
  auto run = orchestrator.run<int, std::string>(
      range(10), unit, nullptr, [&](std::size_t done, std::size_t total) {
        std::lock_guard<std::mutex> lock(mu);
        progress.emplace_back(done, total);
      });

  ASSERT_TRUE(run.is_ok());
  const auto &outcomes = run.value();
  ASSERT_EQ(outcomes.size(), 10u);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(outcomes[i].is_success());
    EXPECT_EQ(outcomes[i].value(), "item-" + std::to_string(i));
  }
  ASSERT_EQ(progress.size(), 10u);
  for (std::size_t i = 0; i < progress.size(); ++i) {
    EXPECT_EQ(progress[i], std::make_pair(i + 1, std::size_t{10}));
  }
}

TEST(Orchestrator, PermanentFailureIsIsolatedAndNotRetried) {
  Orchestrator orchestrator(quick_config(2, 5));
  std::atomic<int> calls_for_failing{0};

  UnitOfWork<int, int> unit = [&](const int &v, const auto &) {
    if (v == 1) {
      calls_for_failing.fetch_add(1);
      return Result<int, TaskError>::Err(TaskError::Permanent("rejected"));
    }
    return Result<int, TaskError>::Ok(v);
  };
  auto run = orchestrator.run<int, int>(range(5), unit);

  ASSERT_TRUE(run.is_ok());
  const auto &outcomes = run.value();
  ASSERT_FALSE(outcomes[1].is_success());
  EXPECT_EQ(outcomes[1].error().kind, ErrorKind::Permanent);
  EXPECT_EQ(outcomes[1].attempts(), 1);
  EXPECT_EQ(calls_for_failing.load(), 1);
  for (int i : {0, 2, 3, 4}) {
    EXPECT_TRUE(outcomes[i].is_success()) << "item " << i;
  }
}

TEST(Orchestrator, TransientFailureIsRetriedUntilSuccess) {
  Orchestrator orchestrator(quick_config(2, 3));
  std::mutex mu;
  std::map<int, int> calls;

  UnitOfWork<int, int> unit = [&](const int &v, const auto &) {
    int n = 0;
    {
      std::lock_guard<std::mutex> lock(mu);
      n = ++calls[v];
    }
    if (v == 0 && n < 3) {
      return Result<int, TaskError>::Err(TaskError::Transient("503"));
    }
    return Result<int, TaskError>::Ok(v);
  };
  auto run = orchestrator.run<int, int>(range(2), unit);

  ASSERT_TRUE(run.is_ok());
  ASSERT_TRUE(run.value()[0].is_success());
  EXPECT_EQ(run.value()[0].attempts(), 3);
  EXPECT_EQ(run.value()[1].attempts(), 1);
}

TEST(Orchestrator, ExhaustedRetriesReportLastErrorAndAttemptCount) {
  Orchestrator orchestrator(quick_config(1, 2));
  UnitOfWork<int, int> unit = [](const int &, const auto &) {
    return Result<int, TaskError>::Err(TaskError::Transient("still down"));
  };

  auto run = orchestrator.run<int, int>(range(1), unit);
  ASSERT_TRUE(run.is_ok());
  const auto &outcome = run.value()[0];
  ASSERT_FALSE(outcome.is_success());
  EXPECT_EQ(outcome.attempts(), 2);
  EXPECT_EQ(outcome.error().kind, ErrorKind::Transient);
  EXPECT_EQ(outcome.error().message, "still down");
}

TEST(Orchestrator, FailFastCancelsRemainingItems) {
  auto cfg = quick_config(1, 1);
  cfg.fail_fast = true;
  auto logger = std::make_shared<RecordingLogger>();
  Orchestrator orchestrator(cfg, logger);
  std::atomic<int> invoked{0};

  UnitOfWork<int, int> unit = [&](const int &v, const auto &) {
    invoked.fetch_add(1);
    if (v == 1) {
      return Result<int, TaskError>::Err(TaskError::Permanent("fatal"));
    }
    return Result<int, TaskError>::Ok(v);
  };
  auto external = CancelToken::create();
  auto run = orchestrator.run<int, int>(range(5), unit, external);

  ASSERT_TRUE(run.is_ok());
  const auto &outcomes = run.value();
  EXPECT_EQ(invoked.load(), 2);
  EXPECT_TRUE(outcomes[0].is_success());
  EXPECT_EQ(outcomes[1].error().kind, ErrorKind::Permanent);
  for (std::size_t i = 2; i < outcomes.size(); ++i) {
    EXPECT_EQ(outcomes[i].error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(outcomes[i].attempts(), 0);
  }
  EXPECT_FALSE(external->is_cancelled());
  EXPECT_TRUE(logger->saw("orchestrator/fail_fast"));
}

TEST(Orchestrator, ThrowAfterTransientFailureCountsBothAttempts) {
  Orchestrator orchestrator(quick_config(1, 3));
  std::atomic<int> calls{0};
  UnitOfWork<int, int> unit = [&](const int &,
                                  const auto &) -> Result<int, TaskError> {
    if (calls.fetch_add(1) == 0) {
      return Result<int, TaskError>::Err(TaskError::Transient("503"));
    }
    throw std::runtime_error("decoder blew up");
  };

  auto run = orchestrator.run<int, int>(range(1), unit);
  ASSERT_TRUE(run.is_ok());
  const auto &outcome = run.value()[0];
  ASSERT_FALSE(outcome.is_success());
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(outcome.attempts(), 2);
  EXPECT_EQ(outcome.error().kind, ErrorKind::Permanent);
  EXPECT_EQ(outcome.error().code, error_code::kUnitThrew);
  EXPECT_EQ(outcome.error().details.at("attempts"), "2");
}

TEST(Orchestrator, FailFastTripsOnThrowingUnit) {
  auto cfg = quick_config(1, 3);
  cfg.fail_fast = true;
  auto logger = std::make_shared<RecordingLogger>();
  Orchestrator orchestrator(cfg, logger);
  std::atomic<int> invoked{0};

  UnitOfWork<int, int> unit = [&](const int &v,
                                  const auto &) -> Result<int, TaskError> {
    invoked.fetch_add(1);
    if (v == 0) {
      throw std::runtime_error("boom");
    }
    return Result<int, TaskError>::Ok(v);
  };
  auto run = orchestrator.run<int, int>(range(4), unit);

  ASSERT_TRUE(run.is_ok());
  const auto &outcomes = run.value();
  EXPECT_EQ(invoked.load(), 1);
  EXPECT_EQ(outcomes[0].error().code, error_code::kUnitThrew);
  EXPECT_EQ(outcomes[0].attempts(), 1);
  for (std::size_t i = 1; i < outcomes.size(); ++i) {
    ASSERT_FALSE(outcomes[i].is_success());
    EXPECT_EQ(outcomes[i].error().kind, ErrorKind::Cancelled);
  }
  EXPECT_TRUE(logger->saw("orchestrator/fail_fast"));
}

TEST(Orchestrator, RetryWarningsNameTheItem) {
  auto logger = std::make_shared<RecordingLogger>();
  Orchestrator orchestrator(quick_config(1, 2), logger);
  UnitOfWork<int, int> unit = [](const int &v, const auto &) {
    if (v == 2) {
      return Result<int, TaskError>::Err(TaskError::Transient("flaky"));
    }
    return Result<int, TaskError>::Ok(v);
  };

  auto run = orchestrator.run<int, int>(range(3), unit);
  ASSERT_TRUE(run.is_ok());
  const auto warnings = logger->messages("retry/retry_scheduled");
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].rfind("item=2 ", 0), 0u) << warnings[0];
}

TEST(Orchestrator, WithoutFailFastEveryItemRuns) {
  Orchestrator orchestrator(quick_config(1, 1));
  std::atomic<int> invoked{0};
  UnitOfWork<int, int> unit = [&](const int &, const auto &) {
    invoked.fetch_add(1);
    return Result<int, TaskError>::Err(TaskError::Permanent("nope"));
  };

  auto run = orchestrator.run<int, int>(range(4), unit);
  ASSERT_TRUE(run.is_ok());
  EXPECT_EQ(invoked.load(), 4);
}

TEST(Orchestrator, ExternalCancellationStopsTheBatch) {
  Orchestrator orchestrator(quick_config(2));
  auto external = CancelToken::create();

  UnitOfWork<int, int> unit = [](const int &,
                                 const std::shared_ptr<CancelToken> &token) {
    if (token->wait_for(5s)) {
      return Result<int, TaskError>::Err(token->check().error());
    }
    return Result<int, TaskError>::Ok(0);
  };
  std::thread canceller([external]() {
    std::this_thread::sleep_for(30ms);
    external->cancel("caller gave up");
  });
  auto run = orchestrator.run<int, int>(range(6), unit, external);
  canceller.join();

  ASSERT_TRUE(run.is_ok());
  for (const auto &outcome : run.value()) {
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(outcome.error().details.at("reason"), "caller gave up");
  }
}

TEST(Orchestrator, RunTimeoutCancelsWithDeadlineCode) {
  auto cfg = quick_config(2);
  cfg.run_timeout = 40ms;
  auto logger = std::make_shared<RecordingLogger>();
  Orchestrator orchestrator(cfg, logger);

  UnitOfWork<int, int> unit = [](const int &,
                                 const std::shared_ptr<CancelToken> &token) {
    if (token->wait_for(5s)) {
      return Result<int, TaskError>::Err(token->check().error());
    }
    return Result<int, TaskError>::Ok(0);
  };
  const auto start = std::chrono::steady_clock::now();
  auto run = orchestrator.run<int, int>(range(4), unit);

  ASSERT_TRUE(run.is_ok());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
  for (const auto &outcome : run.value()) {
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.error().code, error_code::kDeadlineExceeded);
  }
  EXPECT_TRUE(logger->saw("orchestrator/run_deadline_exceeded"));
}

TEST(Orchestrator, InvalidConcurrencyIsRejected) {
  Orchestrator orchestrator(quick_config(0));
  UnitOfWork<int, int> unit = [](const int &v, const auto &) {
    return Result<int, TaskError>::Ok(v);
  };
  auto run = orchestrator.run<int, int>(range(3), unit);
  ASSERT_TRUE(run.is_err());
  EXPECT_EQ(run.error().code, error_code::kInvalidConcurrency);
}

// ---- Streaming ----

TEST(Orchestrator, StreamsDeliverRecordsTaggedWithItemIndex) {
  Orchestrator orchestrator(quick_config(2));
  std::mutex mu;
  std::map<std::size_t, std::vector<DecodedRecord>> seen;

  std::vector<Chunks> inputs = {
      {"data: {\"a\":", "1}\n\ndata: [DO", "NE]\n\n"},
      {"data: x\n\n", "data: y\n\n"},
  };
  auto run = orchestrator.run_streams<Chunks>(
      inputs, replay_unit(), events(),
      [&](std::size_t index, const DecodedRecord &record) {
        std::lock_guard<std::mutex> lock(mu);
        seen[index].push_back(record);
        return true;
      });

  ASSERT_TRUE(run.is_ok());
  const auto &outcomes = run.value();
  ASSERT_TRUE(outcomes[0].is_success());
  ASSERT_TRUE(outcomes[1].is_success());

  std::vector<DecodedRecord> first = {DecodedRecord::Event("{\"a\":1}"),
                                      DecodedRecord::EndOfStream()};
  std::vector<DecodedRecord> second = {DecodedRecord::Event("x"),
                                       DecodedRecord::Event("y"),
                                       DecodedRecord::EndOfStream()};
  EXPECT_EQ(seen[0], first);
  EXPECT_EQ(seen[1], second);

  EXPECT_EQ(outcomes[0].value().events, 1u);
  EXPECT_TRUE(outcomes[0].value().reached_end);
  EXPECT_EQ(outcomes[1].value().events, 2u);
}

TEST(Orchestrator, SentinelStopsReadingTheProducer) {
  Orchestrator orchestrator(quick_config(1));
  std::atomic<int> chunks_offered{0};

  StreamUnit<Chunks> unit = [&](const Chunks &chunks, const ChunkSink &sink,
                                const std::shared_ptr<CancelToken> &) {
    for (const auto &chunk : chunks) {
      chunks_offered.fetch_add(1);
      if (!sink(chunk)) {
        break;
      }
    }
    return Result<void, TaskError>::Ok();
  };
  auto run = orchestrator.run_streams<Chunks>(
      {{"data: [DONE]\n\n", "data: ignored\n\n", "data: ignored\n\n"}}, unit,
      events(), {});

  ASSERT_TRUE(run.is_ok());
  ASSERT_TRUE(run.value()[0].is_success());
  EXPECT_EQ(chunks_offered.load(), 1);
  EXPECT_EQ(run.value()[0].value().events, 0u);
  EXPECT_TRUE(run.value()[0].value().reached_end);
}

TEST(Orchestrator, RecordSinkCanStopAStream) {
  Orchestrator orchestrator(quick_config(1));
  int delivered = 0;

  auto run = orchestrator.run_streams<Chunks>(
      {{"one\ntwo\nthree\n"}}, replay_unit(), DecoderConfig{},
      [&](std::size_t, const DecodedRecord &) { return ++delivered < 2; });

  ASSERT_TRUE(run.is_ok());
  const auto &outcome = run.value()[0];
  ASSERT_FALSE(outcome.is_success());
  EXPECT_EQ(outcome.error().kind, ErrorKind::Cancelled);
  EXPECT_EQ(outcome.error().code, error_code::kStreamStopped);
  EXPECT_EQ(delivered, 2);
}

TEST(Orchestrator, RetriedStreamStartsWithFreshDecoder) {
  Orchestrator orchestrator(quick_config(1, 2));
  std::atomic<int> attempts{0};
  std::vector<DecodedRecord> seen;

  StreamUnit<Chunks> unit = [&](const Chunks &, const ChunkSink &sink,
                                const std::shared_ptr<CancelToken> &) {
    if (attempts.fetch_add(1) == 0) {
      // Half a line, then the connection drops.
      sink("partial li");
      return Result<void, TaskError>::Err(TaskError::Transient("reset"));
    }
    sink("whole line\n");
    return Result<void, TaskError>::Ok();
  };
  auto run = orchestrator.run_streams<Chunks>(
      {Chunks{}}, unit, DecoderConfig{},
      [&](std::size_t, const DecodedRecord &record) {
        seen.push_back(record);
        return true;
      });

  ASSERT_TRUE(run.is_ok());
  ASSERT_TRUE(run.value()[0].is_success());
  EXPECT_EQ(run.value()[0].attempts(), 2);
  std::vector<DecodedRecord> expected = {DecodedRecord::Line("whole line"),
                                         DecodedRecord::EndOfStream()};
  EXPECT_EQ(seen, expected);
}

TEST(Orchestrator, MalformedFramesAreCountedNotFatal) {
  Orchestrator orchestrator(quick_config(1));
  auto run = orchestrator.run_streams<Chunks>(
      {{"nonsense\ndata: ok\n\n"}}, replay_unit(), events(), {});

  ASSERT_TRUE(run.is_ok());
  ASSERT_TRUE(run.value()[0].is_success());
  EXPECT_EQ(run.value()[0].value().malformed, 1u);
  EXPECT_EQ(run.value()[0].value().events, 1u);
}

TEST(Orchestrator, ThrowingStreamUnitFailsOnlyItsItem) {
  Orchestrator orchestrator(quick_config(2, 3));
  StreamUnit<Chunks> unit = [](const Chunks &chunks, const ChunkSink &sink,
                               const std::shared_ptr<CancelToken> &)
      -> Result<void, TaskError> {
    if (chunks.empty()) {
      throw std::runtime_error("socket vanished");
    }
    for (const auto &chunk : chunks) {
      sink(chunk);
    }
    return Result<void, TaskError>::Ok();
  };

  std::vector<Chunks> inputs{Chunks{}, Chunks{"a\n"}};
  auto run = orchestrator.run_streams<Chunks>(std::move(inputs), unit,
                                              DecoderConfig{}, nullptr);
  ASSERT_TRUE(run.is_ok());
  EXPECT_EQ(run.value()[0].error().code, error_code::kUnitThrew);
  EXPECT_EQ(run.value()[0].attempts(), 1);
  ASSERT_TRUE(run.value()[1].is_success());
  EXPECT_EQ(run.value()[1].value().lines, 1u);
}

TEST(Orchestrator, StreamUnitMustNotBeEmpty) {
  Orchestrator orchestrator(quick_config(1));
  auto run = orchestrator.run_streams<Chunks>({{"x"}}, StreamUnit<Chunks>{},
                                              DecoderConfig{}, {});
  ASSERT_TRUE(run.is_err());
  EXPECT_EQ(run.error().code, error_code::kNullUnit);
}
