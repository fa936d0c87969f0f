#include "core/progress_parser.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <system_error>

namespace ngl::core {

namespace {

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_blank(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_blank(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

/// Whole-field decimal parse. Rejects "NA", "12abc", "", "inf" and "nan".
std::optional<double> parse_count(std::string_view field) {
  field = trim(field);
  if (field.empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  const char *first = field.data();
  const char *last = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
  if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<double> parse_progress_line(std::string_view line,
                                          std::string_view marker) noexcept {
  if (line.substr(0, marker.size()) != marker) {
    return std::nullopt;
  }
  line.remove_prefix(marker.size());

  const auto slash = line.find('/');
  if (slash == std::string_view::npos ||
      line.find('/', slash + 1) != std::string_view::npos) {
    return std::nullopt;
  }

  const auto downloaded = parse_count(line.substr(0, slash));
  const auto total = parse_count(line.substr(slash + 1));
  if (!downloaded || !total || *total <= 0.0) {
    return std::nullopt;
  }

  return std::clamp(100.0 * *downloaded / *total, 0.0, 100.0);
}

} // namespace ngl::core
