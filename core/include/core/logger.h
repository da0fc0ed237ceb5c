#pragma once

#include <string>

namespace fanout::core {

/// Logger interface used by the scheduler, retry runner and orchestrator.
/// Concrete implementations live in infra; core only ever holds a nullable
/// shared_ptr and skips logging when it is empty.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace fanout::core
