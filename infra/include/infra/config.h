#pragma once

#include "core/conversion_engine.h"
#include "core/job_registry.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace ngl::core {
class ILogger;
}

namespace ngl::infra {

class PathService;

/// Application configuration, read once at startup from NGL_* variables.
/// Nothing is persisted.
struct AppConfig {
  std::string ytdlp_path = "yt-dlp";
  std::optional<std::string> ffmpeg_dir;
  std::string output_dir;
  std::string audio_format = "mp3";
  int extractor_retries = 5;
  int fragment_retries = 5;
  std::size_t log_retention = ngl::core::JobRegistry::kDefaultLogRetention;
  std::string route_host = "8.8.8.8";

  /// Unset variables keep their defaults; invalid numbers are logged and
  /// ignored. Tools not given explicitly are discovered via ToolLocator.
  static AppConfig from_environment(const PathService &paths,
                                    const std::shared_ptr<ngl::core::ILogger>
                                        &logger = nullptr);

  [[nodiscard]] ngl::core::ConversionOptions conversion_options() const;
};

/// Integer from `name`, or `fallback` when unset, malformed or below
/// `min_value`. Problems are reported through `logger` when present.
int parse_env_int(const char *name, int fallback, int min_value,
                  const std::shared_ptr<ngl::core::ILogger> &logger);

} // namespace ngl::infra
