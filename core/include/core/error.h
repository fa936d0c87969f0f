#pragma once

#include <map>
#include <string>
#include <utility>

namespace ngl::core {

/// Error kinds. Callers branch on these, never on message text.
enum class ErrorKind {
  Spawn,           // Executable missing, not executable, permission denied
  Wait,            // Child process could not be reaped
  Io,              // Pipe or socket read/write failure
  ProcessExit,     // Child exited nonzero or did not exit normally
  Parse,           // Malformed external text (never surfaced for progress)
  NotFound,        // Shared file absent
  Network,         // No local address, bind/listen failure
  Encode,          // Payload does not fit a QR symbol
  InvalidArgument, // Caller supplied an unusable value
  Internal
};

/// Structured error for every job and transfer operation.
struct Error {
  ErrorKind kind = ErrorKind::Internal;
  int code = 0;        // errno, exit code or 0
  std::string message; // Verbatim text retained for log display
  std::map<std::string, std::string> details;

  Error() = default;

  Error(ErrorKind k, int c, std::string msg,
        std::map<std::string, std::string> dets = {})
      : kind(k), code(c), message(std::move(msg)), details(std::move(dets)) {}

  static Error Spawn(std::string msg, int err_no = 0) {
    return {ErrorKind::Spawn, err_no, std::move(msg)};
  }
  static Error Io(std::string msg, int err_no = 0) {
    return {ErrorKind::Io, err_no, std::move(msg)};
  }
  static Error NotFound(std::string msg) {
    return {ErrorKind::NotFound, 0, std::move(msg)};
  }
  static Error Network(std::string msg, int err_no = 0) {
    return {ErrorKind::Network, err_no, std::move(msg)};
  }
  static Error InvalidArgument(std::string msg) {
    return {ErrorKind::InvalidArgument, 0, std::move(msg)};
  }
  static Error Internal(std::string msg) {
    return {ErrorKind::Internal, 0, std::move(msg)};
  }
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Spawn:
    return "Spawn";
  case ErrorKind::Wait:
    return "Wait";
  case ErrorKind::Io:
    return "Io";
  case ErrorKind::ProcessExit:
    return "ProcessExit";
  case ErrorKind::Parse:
    return "Parse";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::Network:
    return "Network";
  case ErrorKind::Encode:
    return "Encode";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::Internal:
    return "Internal";
  }
  return "Internal";
}

} // namespace ngl::core
