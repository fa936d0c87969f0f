#include <gtest/gtest.h>

#include "infra/config.h"
#include "infra/logger.h"
#include "infra/path_service.h"
#include "infra/tool_locator.h"
#include "test_support.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

using namespace ngl::infra;
namespace fs = std::filesystem;

namespace {

/// Sets or clears one environment variable for the lifetime of the object.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name)) {
      previous_ = std::string(old);
    }
    if (value != nullptr) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }
  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_, previous_->c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }
  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
  std::optional<std::string> previous_;
};

class FakePathService : public PathService {
public:
  explicit FakePathService(std::string root) : root_(std::move(root)) {}

  std::string home_dir() const override { return root_; }
  std::string config_dir() const override { return root_ + "/config"; }
  std::string cache_dir() const override { return root_ + "/cache"; }
  std::string data_dir() const override { return root_ + "/data"; }
  std::string download_dir() const override { return root_ + "/Downloads"; }
  std::string local_bin_dir() const override { return root_ + "/bin"; }

private:
  std::string root_;
};

} // namespace

class ConfigEnvTest : public ::testing::Test {
protected:
  ScopedEnv ytdlp_{"NGL_YTDLP_PATH", nullptr};
  ScopedEnv ffmpeg_{"NGL_FFMPEG_DIR", nullptr};
  ScopedEnv output_{"NGL_OUTPUT_DIR", nullptr};
  ScopedEnv format_{"NGL_AUDIO_FORMAT", nullptr};
  ScopedEnv route_{"NGL_ROUTE_HOST", nullptr};
  ScopedEnv extractor_{"NGL_EXTRACTOR_RETRIES", nullptr};
  ScopedEnv fragment_{"NGL_FRAGMENT_RETRIES", nullptr};
  ScopedEnv retention_{"NGL_LOG_RETENTION", nullptr};
  ngl::test::TempDir home_;
};

TEST_F(ConfigEnvTest, DefaultsWithoutEnvironment) {
  FakePathService paths(home_.str());
  const AppConfig config = AppConfig::from_environment(paths);

  EXPECT_EQ(config.output_dir, home_.str() + "/Downloads");
  EXPECT_EQ(config.audio_format, "mp3");
  EXPECT_EQ(config.extractor_retries, 5);
  EXPECT_EQ(config.fragment_retries, 5);
  EXPECT_EQ(config.log_retention,
            ngl::core::JobRegistry::kDefaultLogRetention);
  EXPECT_EQ(config.route_host, "8.8.8.8");
  EXPECT_FALSE(config.ytdlp_path.empty());
}

TEST_F(ConfigEnvTest, DiscoversToolsInLocalBin) {
  fs::create_directories(home_.path() / "bin");
  ngl::test::write_script(home_.path() / "bin", "yt-dlp", "exit 0\n");
  ngl::test::write_script(home_.path() / "bin", "ffmpeg", "exit 0\n");

  FakePathService paths(home_.str());
  const AppConfig config = AppConfig::from_environment(paths);

  EXPECT_EQ(config.ytdlp_path, home_.str() + "/bin/yt-dlp");
  ASSERT_TRUE(config.ffmpeg_dir.has_value());
  EXPECT_EQ(*config.ffmpeg_dir, home_.str() + "/bin");

  const auto options = config.conversion_options();
  EXPECT_EQ(options.tool_path, config.ytdlp_path);
  EXPECT_EQ(options.ffmpeg_location, config.ffmpeg_dir);
}

TEST_F(ConfigEnvTest, EnvironmentOverridesEverything) {
  ScopedEnv ytdlp("NGL_YTDLP_PATH", "/custom/yt-dlp");
  ScopedEnv ffmpeg("NGL_FFMPEG_DIR", "/custom/ffmpeg");
  ScopedEnv output("NGL_OUTPUT_DIR", "/music");
  ScopedEnv format("NGL_AUDIO_FORMAT", "opus");
  ScopedEnv route("NGL_ROUTE_HOST", "1.1.1.1");
  ScopedEnv extractor("NGL_EXTRACTOR_RETRIES", "2");
  ScopedEnv fragment("NGL_FRAGMENT_RETRIES", "0");
  ScopedEnv retention("NGL_LOG_RETENTION", "50");

  FakePathService paths(home_.str());
  auto logger = std::make_shared<ngl::test::RecordingLogger>();
  const AppConfig config = AppConfig::from_environment(paths, logger);

  EXPECT_EQ(config.ytdlp_path, "/custom/yt-dlp");
  EXPECT_EQ(config.ffmpeg_dir.value_or(""), "/custom/ffmpeg");
  EXPECT_EQ(config.output_dir, "/music");
  EXPECT_EQ(config.audio_format, "opus");
  EXPECT_EQ(config.route_host, "1.1.1.1");
  EXPECT_EQ(config.extractor_retries, 2);
  EXPECT_EQ(config.fragment_retries, 0);
  EXPECT_EQ(config.log_retention, 50u);
  EXPECT_TRUE(logger->has_event("loaded"));
  EXPECT_FALSE(logger->has_event("invalid_env"));

  EXPECT_EQ(config.conversion_options().audio_format, "opus");
}

TEST_F(ConfigEnvTest, InvalidNumbersFallBackAndWarn) {
  ScopedEnv extractor("NGL_EXTRACTOR_RETRIES", "lots");
  ScopedEnv fragment("NGL_FRAGMENT_RETRIES", "-3");
  ScopedEnv retention("NGL_LOG_RETENTION", "12abc");

  FakePathService paths(home_.str());
  auto logger = std::make_shared<ngl::test::RecordingLogger>();
  const AppConfig config = AppConfig::from_environment(paths, logger);

  EXPECT_EQ(config.extractor_retries, 5);
  EXPECT_EQ(config.fragment_retries, 5);
  EXPECT_EQ(config.log_retention,
            ngl::core::JobRegistry::kDefaultLogRetention);
  EXPECT_TRUE(logger->has_event("invalid_env"));
}

TEST_F(ConfigEnvTest, ParseEnvInt) {
  EXPECT_EQ(parse_env_int("NGL_EXTRACTOR_RETRIES", 7, 0, nullptr), 7);
  {
    ScopedEnv value("NGL_EXTRACTOR_RETRIES", "12");
    EXPECT_EQ(parse_env_int("NGL_EXTRACTOR_RETRIES", 7, 0, nullptr), 12);
    EXPECT_EQ(parse_env_int("NGL_EXTRACTOR_RETRIES", 7, 20, nullptr), 7);
  }
  {
    ScopedEnv empty("NGL_EXTRACTOR_RETRIES", "");
    EXPECT_EQ(parse_env_int("NGL_EXTRACTOR_RETRIES", 7, 0, nullptr), 7);
  }
}

TEST(ToolLocatorTest, FindsFirstExecutableInSearchOrder) {
  ngl::test::TempDir root;
  fs::create_directories(root.path() / "a");
  fs::create_directories(root.path() / "b");
  ngl::test::write_file(root.path() / "a" / "tool", "not executable");
  ngl::test::write_script(root.path() / "b", "tool", "exit 0\n");

  ToolLocator locator({"", (root.path() / "missing").string(),
                       (root.path() / "a").string(),
                       (root.path() / "b").string()});
  EXPECT_EQ(locator.find("tool").value_or(""),
            (root.path() / "b" / "tool").string());
  EXPECT_EQ(locator.find_dir("tool").value_or(""),
            (root.path() / "b").string());
  EXPECT_FALSE(locator.find("other").has_value());
  EXPECT_EQ(locator.find_or_bare("other"), "other");
}

TEST(ToolLocatorTest, DefaultDirsStartWithLocalBin) {
  FakePathService paths("/home/someone");
  const auto locator = ToolLocator::with_default_dirs(paths);
  ASSERT_EQ(locator.search_dirs().size(), 4u);
  EXPECT_EQ(locator.search_dirs().front(), "/home/someone/bin");
  EXPECT_EQ(locator.search_dirs().back(), "/usr/bin");
}

TEST(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level("TRACE"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
  EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
  EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(LoggerTest, ConsoleLoggerAcceptsAllLevels) {
  auto logger = create_console_logger(LogLevel::Off);
  ASSERT_NE(logger, nullptr);
  logger->debug("t", "test", "debug_event", "d");
  logger->info("t", "test", "info_event", "i");
  logger->warn("t", "test", "warn_event", "w");
  logger->error("t", "test", "error_event", "e");

  ScopedEnv level("NGL_LOG_LEVEL", "warn");
  EXPECT_NE(create_console_logger_from_env(), nullptr);
}
