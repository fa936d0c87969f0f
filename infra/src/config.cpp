#include "infra/config.h"

#include "core/logger.h"
#include "infra/path_service.h"
#include "infra/tool_locator.h"

#include <charconv>
#include <cstdlib>

namespace ngl::infra {

namespace {

constexpr const char *kComponent = "config";

const char *env_or_null(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr && value[0] != '\0' ? value : nullptr;
}

} // namespace

int parse_env_int(const char *name, int fallback, int min_value,
                  const std::shared_ptr<ngl::core::ILogger> &logger) {
  const char *raw = env_or_null(name);
  if (raw == nullptr) {
    return fallback;
  }
  const std::string value(raw);
  int parsed = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() ||
      parsed < min_value) {
    if (logger) {
      logger->warn("config", kComponent, "invalid_env",
                   std::string(name) + "='" + value + "', using " +
                       std::to_string(fallback));
    }
    return fallback;
  }
  return parsed;
}

AppConfig
AppConfig::from_environment(const PathService &paths,
                            const std::shared_ptr<ngl::core::ILogger> &logger) {
  AppConfig config;
  const auto locator = ToolLocator::with_default_dirs(paths);

  if (const char *ytdlp = env_or_null("NGL_YTDLP_PATH")) {
    config.ytdlp_path = ytdlp;
  } else {
    config.ytdlp_path = locator.find_or_bare("yt-dlp");
  }

  if (const char *ffmpeg = env_or_null("NGL_FFMPEG_DIR")) {
    config.ffmpeg_dir = std::string(ffmpeg);
  } else {
    config.ffmpeg_dir = locator.find_dir("ffmpeg");
  }

  if (const char *out = env_or_null("NGL_OUTPUT_DIR")) {
    config.output_dir = out;
  } else {
    config.output_dir = paths.download_dir();
  }

  if (const char *fmt = env_or_null("NGL_AUDIO_FORMAT")) {
    config.audio_format = fmt;
  }
  if (const char *route = env_or_null("NGL_ROUTE_HOST")) {
    config.route_host = route;
  }

  config.extractor_retries = parse_env_int(
      "NGL_EXTRACTOR_RETRIES", config.extractor_retries, 0, logger);
  config.fragment_retries = parse_env_int(
      "NGL_FRAGMENT_RETRIES", config.fragment_retries, 0, logger);
  config.log_retention = static_cast<std::size_t>(parse_env_int(
      "NGL_LOG_RETENTION", static_cast<int>(config.log_retention), 0, logger));

  if (logger) {
    logger->info("config", kComponent, "loaded",
                 "ytdlp=" + config.ytdlp_path + " ffmpeg_dir=" +
                     config.ffmpeg_dir.value_or("<none>") +
                     " output_dir=" + config.output_dir);
  }
  return config;
}

ngl::core::ConversionOptions AppConfig::conversion_options() const {
  ngl::core::ConversionOptions options;
  options.tool_path = ytdlp_path;
  options.ffmpeg_location = ffmpeg_dir;
  options.audio_format = audio_format;
  options.extractor_retries = extractor_retries;
  options.fragment_retries = fragment_retries;
  return options;
}

} // namespace ngl::infra
