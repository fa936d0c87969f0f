#include "infra/posix_process.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <mutex>
#include <vector>

namespace ngl::infra {

using ngl::core::Error;
using ngl::core::ErrorKind;
using ngl::core::ExitStatus;
using ngl::core::Result;

namespace {

constexpr std::size_t kReadChunk = 4096;

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  ~Pipe() {
    close_fd(read_end);
    close_fd(write_end);
  }

  bool open() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  int release_read() {
    const int fd = read_end;
    read_end = -1;
    return fd;
  }
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const ngl::core::ProcessSpec &spec,
                             char *const *argv, int out_fd, int err_fd,
                             int status_fd) {
  int err = 0;
  const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0 ||
      ::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
    err = errno;
  } else if (!spec.working_dir.empty() &&
             ::chdir(spec.working_dir.c_str()) != 0) {
    err = errno;
  } else {
    if (spec.program.find('/') != std::string::npos) {
      ::execv(spec.program.c_str(), argv);
    } else {
      ::execvp(spec.program.c_str(), argv);
    }
    err = errno;
  }
  ssize_t ignored = ::write(status_fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

class PosixProcessHandle final : public ngl::core::IProcessHandle {
public:
  PosixProcessHandle(pid_t pid, int out_fd, int err_fd)
      : pid_(pid), stdout_(std::make_unique<FdLineReader>(out_fd)),
        stderr_(std::make_unique<FdLineReader>(err_fd)) {}

  ~PosixProcessHandle() override {
    // Reap so the child never lingers as a zombie.
    if (!reaped_) {
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
  }

  std::unique_ptr<ngl::core::ILineReader> take_stdout() override {
    return std::move(stdout_);
  }

  std::unique_ptr<ngl::core::ILineReader> take_stderr() override {
    return std::move(stderr_);
  }

  Result<ExitStatus, Error> wait() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
      return Result<ExitStatus, Error>::Ok(status_);
    }
    int raw = 0;
    pid_t rc;
    do {
      rc = ::waitpid(pid_, &raw, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      const int err = errno;
      return Result<ExitStatus, Error>::Err(
          Error(ErrorKind::Wait, err,
                std::string("Failed to wait for process: ") +
                    std::strerror(err)));
    }
    reaped_ = true;
    if (WIFEXITED(raw)) {
      status_.exited = true;
      status_.code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
      status_.signal = WTERMSIG(raw);
    }
    return Result<ExitStatus, Error>::Ok(status_);
  }

private:
  pid_t pid_;
  std::unique_ptr<FdLineReader> stdout_;
  std::unique_ptr<FdLineReader> stderr_;
  std::mutex mutex_;
  bool reaped_ = false;
  ExitStatus status_;
};

} // namespace

FdLineReader::FdLineReader(int fd) : fd_(fd) {}

FdLineReader::~FdLineReader() { close_fd(fd_); }

std::string FdLineReader::take(std::size_t len, std::size_t skip) {
  std::string line = buffer_.substr(start_, len);
  start_ += len + skip;
  scanned_ = start_;
  if (start_ == buffer_.size()) {
    buffer_.clear();
    start_ = scanned_ = 0;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

Result<std::optional<std::string>, Error> FdLineReader::read_line() {
  using R = Result<std::optional<std::string>, Error>;
  while (true) {
    const auto nl = buffer_.find('\n', scanned_);
    if (nl != std::string::npos) {
      return R::Ok(std::optional<std::string>(take(nl - start_, 1)));
    }
    scanned_ = buffer_.size();
    const std::size_t pending = buffer_.size() - start_;
    if (pending >= kMaxLineBytes) {
      return R::Ok(std::optional<std::string>(take(kMaxLineBytes, 0)));
    }
    if (eof_ || fd_ < 0) {
      if (pending == 0) {
        return R::Ok(std::nullopt);
      }
      return R::Ok(std::optional<std::string>(take(pending, 0)));
    }

    char chunk[kReadChunk];
    const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      return R::Err(Error::Io(std::string("Pipe read failed: ") +
                                  std::strerror(err),
                              err));
    }
    if (n == 0) {
      eof_ = true;
      continue;
    }
    if (start_ > 0) {
      buffer_.erase(0, start_);
      scanned_ -= start_;
      start_ = 0;
    }
    buffer_.append(chunk, static_cast<std::size_t>(n));
  }
}

Result<std::unique_ptr<ngl::core::IProcessHandle>, Error>
PosixProcessLauncher::spawn(const ngl::core::ProcessSpec &spec) {
  using R = Result<std::unique_ptr<ngl::core::IProcessHandle>, Error>;

  if (spec.program.empty()) {
    return R::Err(Error::Spawn("No program given"));
  }

  Pipe out, err, status;
  if (!out.open() || !err.open() || !status.open()) {
    const int e = errno;
    return R::Err(Error::Spawn(
        std::string("Failed to create pipes: ") + std::strerror(e), e));
  }

  // argv is built before fork; the child must not allocate.
  std::vector<std::string> args;
  args.reserve(spec.args.size() + 1);
  args.push_back(spec.program);
  args.insert(args.end(), spec.args.begin(), spec.args.end());
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int e = errno;
    return R::Err(Error::Spawn(
        std::string("Failed to fork: ") + std::strerror(e), e));
  }
  if (pid == 0) {
    exec_child(spec, argv.data(), out.write_end, err.write_end,
               status.write_end);
  }

  close_fd(out.write_end);
  close_fd(err.write_end);
  close_fd(status.write_end);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status.read_end, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int raw = 0;
    while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {
    }
    return R::Err(Error::Spawn("Failed to run " + spec.program + ": " +
                                   std::strerror(child_errno),
                               child_errno));
  }

  return R::Ok(std::make_unique<PosixProcessHandle>(pid, out.release_read(),
                                                    err.release_read()));
}

} // namespace ngl::infra
