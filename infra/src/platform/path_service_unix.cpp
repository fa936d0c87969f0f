#include "infra/path_service.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include <stdexcept>
#include <string>

namespace ngl::infra {

namespace {

std::string resolve_home() {
  const char *home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return std::string(home);
  }
  passwd *pw = getpwuid(getuid());
  if (pw != nullptr && pw->pw_dir != nullptr) {
    return std::string(pw->pw_dir);
  }
  throw std::runtime_error("Unable to resolve HOME directory");
}

std::string xdg_or(const char *var, const std::string &fallback) {
  const char *xdg = std::getenv(var);
  return xdg != nullptr && xdg[0] != '\0' ? std::string(xdg) + "/nightingale"
                                          : fallback;
}

class PathServiceUnix final : public PathService {
public:
  [[nodiscard]] std::string home_dir() const override { return resolve_home(); }

  [[nodiscard]] std::string config_dir() const override {
#ifdef __APPLE__
    return resolve_home() + "/Library/Application Support/nightingale";
#else
    return xdg_or("XDG_CONFIG_HOME", resolve_home() + "/.config/nightingale");
#endif
  }

  [[nodiscard]] std::string cache_dir() const override {
#ifdef __APPLE__
    return resolve_home() + "/Library/Caches/nightingale";
#else
    return xdg_or("XDG_CACHE_HOME", resolve_home() + "/.cache/nightingale");
#endif
  }

  [[nodiscard]] std::string data_dir() const override {
#ifdef __APPLE__
    return resolve_home() + "/Library/Application Support/nightingale/data";
#else
    return xdg_or("XDG_DATA_HOME",
                  resolve_home() + "/.local/share/nightingale");
#endif
  }

  [[nodiscard]] std::string download_dir() const override {
    return resolve_home() + "/Downloads";
  }

  [[nodiscard]] std::string local_bin_dir() const override {
    return resolve_home() + "/.local/bin";
  }
};

} // namespace

std::unique_ptr<PathService> PathService::create() {
  return std::make_unique<PathServiceUnix>();
}

} // namespace ngl::infra
