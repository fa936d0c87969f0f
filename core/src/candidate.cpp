#include "core/candidate.h"

#include <array>
#include <cstdio>
#include <string_view>

namespace ngl::core {

namespace {

constexpr std::array<std::string_view, 16> kTitleDecorations = {
    " (Official Music Video)", " (Official Video)", " [Official Music Video]",
    " [Official Video]",       " (Official Audio)", " [Official Audio]",
    " (Lyric Video)",          " [Lyric Video]",    " (Lyrics)",
    " [Lyrics]",               " (Music Video)",    " [Music Video]",
    " (HD)",                   " [HD]",             " (4K)",
    " [4K]",
};

void erase_all(std::string &s, std::string_view from) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.erase(pos, from.size());
  }
}

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

} // namespace

std::string clean_filename(const std::string &title) {
  std::string cleaned = title;
  for (const auto decoration : kTitleDecorations) {
    erase_all(cleaned, decoration);
  }
  return trim(cleaned);
}

std::string sanitize_filename(const std::string &name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7f) {
      out.push_back('_');
    } else {
      out.push_back(c);
    }
  }
  out = trim(out);
  const auto first = out.find_first_not_of('.');
  return first == std::string::npos ? std::string() : out.substr(first);
}

bool is_watch_url(const std::string &input) {
  return input.find("youtube.com/") != std::string::npos ||
         input.find("youtu.be/") != std::string::npos;
}

std::string format_duration(const std::optional<std::int64_t> &seconds) {
  if (!seconds || *seconds < 0) {
    return {};
  }
  const auto h = *seconds / 3600;
  const auto m = (*seconds % 3600) / 60;
  const auto s = *seconds % 60;
  char buf[32];
  if (h > 0) {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                  static_cast<long long>(h), static_cast<long long>(m),
                  static_cast<long long>(s));
  } else {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld", static_cast<long long>(m),
                  static_cast<long long>(s));
  }
  return buf;
}

} // namespace ngl::core
