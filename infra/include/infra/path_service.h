#pragma once

#include <memory>
#include <string>

namespace ngl::infra {

class PathService {
public:
  virtual ~PathService() = default;

  [[nodiscard]] virtual std::string home_dir() const = 0;
  [[nodiscard]] virtual std::string config_dir() const = 0;
  [[nodiscard]] virtual std::string cache_dir() const = 0;
  [[nodiscard]] virtual std::string data_dir() const = 0;
  [[nodiscard]] virtual std::string download_dir() const = 0;
  /// Per-user executables (~/.local/bin); first place tools are looked up.
  [[nodiscard]] virtual std::string local_bin_dir() const = 0;

  static std::unique_ptr<PathService> create();
};

} // namespace ngl::infra
