#pragma once

#include "core/logger.h"

#include <memory>
#include <optional>
#include <string>

namespace ngl::infra {

/// Severity threshold for the console logger. Parsed from NGL_LOG_LEVEL.
enum class LogLevel { Debug, Info, Warn, Error, Off };

/// "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string &text);

/// spdlog-backed logger. Format: [ts] [level] [trace_id] [component] event: msg
std::shared_ptr<ngl::core::ILogger>
create_console_logger(LogLevel level = LogLevel::Info);

/// Console logger with the level taken from NGL_LOG_LEVEL (default info).
std::shared_ptr<ngl::core::ILogger> create_console_logger_from_env();

} // namespace ngl::infra
