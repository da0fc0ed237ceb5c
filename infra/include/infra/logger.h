#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace fanout::infra {

enum class LogLevel { Debug, Info, Warn, Error, Off };

/// Parse "debug" / "info" / "warn" / "error" / "off" (case-sensitive).
/// Unknown names fall back to Info.
LogLevel parse_log_level(const std::string &name);

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
std::shared_ptr<fanout::core::ILogger>
create_console_logger(LogLevel level = LogLevel::Info);

} // namespace fanout::infra
