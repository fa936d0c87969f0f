#pragma once

#include "core/process.h"

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace ngl::infra {

/// Buffered line reader over a pipe file descriptor it owns.
class FdLineReader final : public ngl::core::ILineReader {
public:
  explicit FdLineReader(int fd);
  ~FdLineReader() override;

  FdLineReader(const FdLineReader &) = delete;
  FdLineReader &operator=(const FdLineReader &) = delete;

  /// Lines longer than kMaxLineBytes are split into kMaxLineBytes pieces.
  ngl::core::Result<std::optional<std::string>, ngl::core::Error>
  read_line() override;

  static constexpr std::size_t kMaxLineBytes = 64 * 1024;

private:
  std::string take(std::size_t len, std::size_t skip);

  int fd_;
  std::string buffer_;
  std::size_t start_ = 0;   // first unconsumed byte
  std::size_t scanned_ = 0; // bytes before this hold no newline
  bool eof_ = false;
};

/// fork/exec launcher. Both output pipes are close-on-exec in the parent;
/// stdin is /dev/null. exec failures are reported synchronously through a
/// status pipe.
class PosixProcessLauncher final : public ngl::core::IProcessLauncher {
public:
  ngl::core::Result<std::unique_ptr<ngl::core::IProcessHandle>,
                    ngl::core::Error>
  spawn(const ngl::core::ProcessSpec &spec) override;
};

} // namespace ngl::infra
