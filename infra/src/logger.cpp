#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ngl::infra {

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

/// ConsoleLogger: spdlog-based structured logger.
class ConsoleLogger : public ngl::core::ILogger {
public:
  explicit ConsoleLogger(LogLevel level) {
    logger_ = spdlog::get("nightingale");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("nightingale");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    logger_->set_level(to_spdlog(level));
  }

  void debug(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", trace_id, component, event, msg);
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

std::optional<LogLevel> parse_log_level(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug" || lower == "trace") {
    return LogLevel::Debug;
  }
  if (lower == "info") {
    return LogLevel::Info;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::Warn;
  }
  if (lower == "error") {
    return LogLevel::Error;
  }
  if (lower == "off" || lower == "none") {
    return LogLevel::Off;
  }
  return std::nullopt;
}

std::shared_ptr<ngl::core::ILogger> create_console_logger(LogLevel level) {
  return std::make_shared<ConsoleLogger>(level);
}

std::shared_ptr<ngl::core::ILogger> create_console_logger_from_env() {
  LogLevel level = LogLevel::Info;
  const char *env = std::getenv("NGL_LOG_LEVEL");
  if (env != nullptr && env[0] != '\0') {
    level = parse_log_level(env).value_or(LogLevel::Info);
  }
  return create_console_logger(level);
}

} // namespace ngl::infra
