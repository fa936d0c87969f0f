#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ngl::core {

/// One search result, supplied by the search collaborator before any job
/// starts. This subsystem never runs searches itself.
struct CandidateItem {
  std::string id;
  std::string title;
  std::string channel;
  std::optional<std::int64_t> duration_seconds;
  std::optional<std::string> views; // display text, e.g. "1.2M views"
  std::string thumbnail_url;
};

/// Suggested output filename for a title: strips video decorations such as
/// " (Official Music Video)" or " [HD]" and surrounding whitespace.
std::string clean_filename(const std::string &title);

/// Make a caller-supplied filename safe to append to the output directory:
/// path separators and control characters become '_', leading dots and
/// surrounding whitespace are removed. May return an empty string.
std::string sanitize_filename(const std::string &name);

/// True for youtube.com / youtu.be links.
bool is_watch_url(const std::string &input);

/// "3:07", "1:02:03"; empty when unknown.
std::string format_duration(const std::optional<std::int64_t> &seconds);

} // namespace ngl::core
