#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ngl::infra {

class PathService;

/// Finds external tools in the usual install locations. GUI launches often
/// get a minimal PATH, so well-known directories are searched explicitly.
class ToolLocator {
public:
  explicit ToolLocator(std::vector<std::string> search_dirs);

  /// ~/.local/bin, /opt/homebrew/bin, /usr/local/bin, /usr/bin.
  static ToolLocator with_default_dirs(const PathService &paths);

  /// First executable `<dir>/<name>` in search order.
  [[nodiscard]] std::optional<std::string> find(const std::string &name) const;

  /// find(name), or the bare name so spawning falls back to a PATH lookup.
  [[nodiscard]] std::string find_or_bare(const std::string &name) const;

  /// Directory holding an executable `name`, for --ffmpeg-location.
  [[nodiscard]] std::optional<std::string>
  find_dir(const std::string &name) const;

  [[nodiscard]] const std::vector<std::string> &search_dirs() const {
    return search_dirs_;
  }

private:
  std::vector<std::string> search_dirs_;
};

} // namespace ngl::infra
