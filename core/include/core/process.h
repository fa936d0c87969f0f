#pragma once

#include "core/error.h"
#include "core/result.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ngl::core {

/// What to run. `program` is a path, or a bare name resolved through PATH.
struct ProcessSpec {
  std::string program;
  std::vector<std::string> args; // argv[1..], program name excluded
  std::string working_dir;       // empty = inherit
};

struct ExitStatus {
  bool exited = false;       // normal termination via exit()
  std::optional<int> code;   // set when exited
  std::optional<int> signal; // set when killed by a signal

  [[nodiscard]] bool success() const { return exited && code && *code == 0; }
};

/// Line-oriented reader over one output pipe of a child process.
class ILineReader {
public:
  virtual ~ILineReader() = default;

  /// Next line without its terminator; std::nullopt at end of stream.
  /// Err(Io) when the underlying read fails.
  virtual Result<std::optional<std::string>, Error> read_line() = 0;
};

/// A running child process with two independently drainable pipes.
/// No timeout or kill: the handle lives until the child exits on its own.
class IProcessHandle {
public:
  virtual ~IProcessHandle() = default;

  /// Each reader can be taken once; later calls return nullptr.
  virtual std::unique_ptr<ILineReader> take_stdout() = 0;
  virtual std::unique_ptr<ILineReader> take_stderr() = 0;

  /// Block until the child exits. Err(Wait) if it cannot be reaped.
  virtual Result<ExitStatus, Error> wait() = 0;
};

class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;

  /// Err(Spawn) when the binary is missing, not executable, or the
  /// working directory is unusable.
  virtual Result<std::unique_ptr<IProcessHandle>, Error>
  spawn(const ProcessSpec &spec) = 0;
};

} // namespace ngl::core
