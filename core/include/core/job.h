#pragma once

#include "core/error.h"
#include "core/result.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <variant>

namespace ngl::core {

/// Identifies the item being converted. Unique among concurrently active
/// jobs; reusing a key starts a fresh, independent job.
using JobKey = std::string;

// ---- Job events ----

/// Download progress in percent, [0, 100].
struct ProgressUpdate {
  double percent = 0.0;
};

enum class OutputStream { Stdout, Stderr };

const char *to_string(OutputStream stream);

/// One raw line of external tool output, forwarded verbatim.
struct LogLine {
  std::string text;
  OutputStream stream = OutputStream::Stdout;
};

/// Terminal event. Exactly one per job, always last.
struct Completed {
  Result<std::string, Error> outcome;
};

using JobEvent = std::variant<ProgressUpdate, LogLine, Completed>;

[[nodiscard]] inline bool is_terminal(const JobEvent &event) {
  return std::holds_alternative<Completed>(event);
}

// ---- Caller-side job state ----

/// State of one job as seen by the caller, rebuilt only from its event
/// stream. Kept after completion until discarded.
struct JobState {
  bool is_active = false;
  std::optional<double> progress;
  std::deque<std::string> log;
  std::optional<std::string> last_message;
  std::optional<ErrorKind> last_error_kind;
  std::size_t dropped_log_lines = 0;
};

/// Handle on one job generation inside the registry. Events applied with a
/// stale ticket (an older job under the same key) are ignored.
struct JobTicket {
  JobKey key;
  std::uint64_t generation = 0;
};

} // namespace ngl::core
