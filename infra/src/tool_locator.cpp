#include "infra/tool_locator.h"

#include "infra/path_service.h"

#include <unistd.h>

#include <filesystem>
#include <system_error>
#include <utility>

namespace ngl::infra {

namespace {

bool is_executable_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec) || ec) {
    return false;
  }
  return ::access(p.c_str(), X_OK) == 0;
}

} // namespace

ToolLocator::ToolLocator(std::vector<std::string> search_dirs)
    : search_dirs_(std::move(search_dirs)) {}

ToolLocator ToolLocator::with_default_dirs(const PathService &paths) {
  return ToolLocator({paths.local_bin_dir(), "/opt/homebrew/bin",
                      "/usr/local/bin", "/usr/bin"});
}

std::optional<std::string> ToolLocator::find(const std::string &name) const {
  for (const auto &dir : search_dirs_) {
    if (dir.empty()) {
      continue;
    }
    const auto candidate = std::filesystem::path(dir) / name;
    if (is_executable_file(candidate)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

std::string ToolLocator::find_or_bare(const std::string &name) const {
  return find(name).value_or(name);
}

std::optional<std::string>
ToolLocator::find_dir(const std::string &name) const {
  auto path = find(name);
  if (!path) {
    return std::nullopt;
  }
  return std::filesystem::path(*path).parent_path().string();
}

} // namespace ngl::infra
