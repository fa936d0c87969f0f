#pragma once

#include <optional>
#include <string_view>

namespace ngl::core {

/// Prefix yt-dlp prints for each line produced by our --progress-template.
inline constexpr std::string_view kProgressMarker = "download:";

/// Template handed to yt-dlp so its progress lines match the parser below.
inline constexpr std::string_view kProgressTemplate =
    "download:%(progress.downloaded_bytes)s/%(progress.total_bytes)s";

/// Parse one line of tool output as `<marker><downloaded>/<total>`.
///
/// Returns clamp(100 * downloaded / total, 0, 100) when both counts are
/// decimal numbers and total > 0; std::nullopt for anything else (empty,
/// "NA", trailing garbage, zero total). Never throws.
[[nodiscard]] std::optional<double>
parse_progress_line(std::string_view line,
                    std::string_view marker = kProgressMarker) noexcept;

} // namespace ngl::core
