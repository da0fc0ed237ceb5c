#include "core/frame_decoder.h"
#include "core/logger.h"
#include "core/orchestrator.h"
#include "infra/config.h"
#include "infra/curl_stream_source.h"
#include "infra/logger.h"

#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

void print_usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " URL [URL...]\n"
            << "Streams every URL concurrently and prints decoded records.\n"
            << "Settings come from FANOUT_* environment variables.\n";
}

std::string describe(const fanout::core::TaskError &error) {
  std::string text = std::string(fanout::core::to_string(error.kind)) + " (" +
                     std::to_string(error.code) + "): " + error.message;
  auto internal = error.details.find("internal_message");
  if (internal != error.details.end() && !internal->second.empty()) {
    text += " [" + internal->second + "]";
  }
  return text;
}

} // namespace

int main(int argc, char *argv[]) {
  auto config_result = fanout::infra::FetchConfig::from_environment();
  if (config_result.is_err()) {
    std::cerr << "configuration error: " << config_result.error().message
              << "\n";
    return 2;
  }
  const fanout::infra::FetchConfig config = config_result.value();
  auto logger = fanout::infra::create_console_logger(config.log_level);

  if (argc < 2) {
    print_usage(argv[0]);
    return 2;
  }
  std::vector<std::string> urls(argv + 1, argv + argc);

  if (!fanout::infra::CurlStreamSource::available()) {
    logger->error("startup", "app", "backend_unavailable",
                  "built without libcurl; nothing can be fetched");
    return 1;
  }

  fanout::infra::CurlStreamSource source(logger);
  fanout::infra::StreamRequest prototype;
  prototype.timeout = std::chrono::milliseconds(config.request_timeout_ms);
  if (config.decode_mode == fanout::core::DecodeMode::Event) {
    prototype.headers["Accept"] = "text/event-stream";
  }

  std::mutex out_mutex;
  fanout::core::RecordSink print_record =
      [&](std::size_t index, const fanout::core::DecodedRecord &record) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << "[" << index << "] " << record << "\n";
        return true;
      };

  fanout::core::ProgressCallback progress = [&](std::size_t done,
                                                std::size_t total) {
    logger->info("-", "app", "progress",
                 std::to_string(done) + "/" + std::to_string(total));
  };

  fanout::core::Orchestrator orchestrator(config.to_orchestrator_config(),
                                          logger);
  auto run = orchestrator.run_streams<std::string>(
      urls, source.unit_for(prototype), config.to_decoder_config(),
      print_record, nullptr, progress);
  if (run.is_err()) {
    logger->error("-", "app", "run_rejected", describe(run.error()));
    return 2;
  }

  const auto &outcomes = run.value();
  std::size_t failed = 0;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const auto &outcome = outcomes[i];
    if (outcome.is_success()) {
      const auto &summary = outcome.value();
      std::cerr << urls[i] << ": ok records=" << summary.records
                << " malformed=" << summary.malformed
                << " attempts=" << outcome.attempts()
                << (summary.reached_end ? " (end marker)" : "") << "\n";
    } else {
      ++failed;
      std::cerr << urls[i] << ": failed after " << outcome.attempts()
                << " attempt(s): " << describe(outcome.error()) << "\n";
    }
  }

  return failed == 0 ? 0 : 1;
}
