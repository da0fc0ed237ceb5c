#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fanout::infra {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Info:
    return spdlog::level::info;
  case LogLevel::Warn:
    return spdlog::level::warn;
  case LogLevel::Error:
    return spdlog::level::err;
  case LogLevel::Off:
    return spdlog::level::off;
  }
  return spdlog::level::info;
}

/// ConsoleLogger: spdlog-based structured logger shared by every run.
class ConsoleLogger : public fanout::core::ILogger {
public:
  explicit ConsoleLogger(LogLevel level) {
    logger_ = spdlog::get("fanout");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("fanout");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    logger_->set_level(to_spdlog(level));
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

LogLevel parse_log_level(const std::string &name) {
  if (name == "debug") {
    return LogLevel::Debug;
  }
  if (name == "warn") {
    return LogLevel::Warn;
  }
  if (name == "error") {
    return LogLevel::Error;
  }
  if (name == "off") {
    return LogLevel::Off;
  }
  return LogLevel::Info;
}

std::shared_ptr<fanout::core::ILogger> create_console_logger(LogLevel level) {
  return std::make_shared<ConsoleLogger>(level);
}

} // namespace fanout::infra
