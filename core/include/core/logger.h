#pragma once

#include <string>

namespace ngl::core {

/// Logger interface used by the job and transfer engines.
/// The spdlog-backed implementation lives in infra; tests pass nullptr or a
/// recording logger.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace ngl::core
