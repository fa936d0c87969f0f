#include "infra/transfer_service.h"

#include "core/logger.h"
#include "infra/net_util.h"
#include "infra/qr_code.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <filesystem>
#include <system_error>

namespace ngl::infra {

using ngl::core::Error;
using ngl::core::Result;

namespace {

constexpr const char *kComponent = "transfer_service";
constexpr int kListenBacklog = 16;

} // namespace

Result<std::unique_ptr<TransferService>, Error>
TransferService::create(const std::string &file_path,
                        std::shared_ptr<ngl::core::ILogger> logger,
                        TransferOptions options) {
  using R = Result<std::unique_ptr<TransferService>, Error>;

  std::error_code ec;
  const std::filesystem::path path(file_path);
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return R::Err(Error::NotFound("File does not exist: " + file_path));
  }
  const std::string name = path.filename().string();
  if (name.empty()) {
    return R::Err(Error::InvalidArgument("Invalid filename: " + file_path));
  }

  auto port = select_ephemeral_port();
  if (port.is_err()) {
    return R::Err(std::move(port).error());
  }

  std::unique_ptr<TransferService> service(new TransferService(
      file_path, name, port.value(), std::move(logger), std::move(options)));
  return R::Ok(std::move(service));
}

TransferService::TransferService(std::string file_path,
                                 std::string display_name, std::uint16_t port,
                                 std::shared_ptr<ngl::core::ILogger> logger,
                                 TransferOptions options)
    : file_path_(std::move(file_path)), display_name_(std::move(display_name)),
      port_(port), trace_id_("transfer:" + std::to_string(port)),
      logger_(std::move(logger)), options_(std::move(options)),
      endpoint_(file_path_, display_name_, logger_, trace_id_),
      stop_(ngl::core::StopSignal::create()) {}

TransferService::~TransferService() {
  stop();
  wait();
}

Result<std::string, Error> TransferService::get_url() const {
  auto ip = discover_local_ip(options_.route_host, options_.route_port);
  if (ip.is_err()) {
    return ip;
  }
  return Result<std::string, Error>::Ok("http://" + ip.value() + ":" +
                                        std::to_string(port_));
}

Result<std::string, Error> TransferService::generate_display_code() const {
  auto url = get_url();
  if (url.is_err()) {
    return url;
  }
  auto code = QrCode::encode_text(url.value(), QrEcc::Medium);
  if (code.is_err()) {
    return Result<std::string, Error>::Err(std::move(code).error());
  }
  return Result<std::string, Error>::Ok(code.value().render_half_blocks());
}

Result<void, Error> TransferService::start() {
  using R = Result<void, Error>;
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (stop_->is_stop_requested()) {
    return R::Err(Error::InvalidArgument(
        "Transfer service was stopped; create a new one to share again"));
  }
  if (started_) {
    return R::Ok();
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    const int err = errno;
    return R::Err(Error::Network(
        std::string("Failed to start server: ") + std::strerror(err), err));
  }
  const auto fail = [&](const std::string &what) {
    const int err = errno;
    ::close(fd);
    return R::Err(Error::Network("Failed to start server: " + what + ": " +
                                     std::strerror(err),
                                 err));
  };

  int enable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) !=
      0) {
    return fail("setsockopt");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port_);
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    return fail("bind 0.0.0.0:" + std::to_string(port_));
  }
  if (::listen(fd, kListenBacklog) != 0) {
    return fail("listen");
  }
  // accept() must not block if a polled connection is reset before it runs.
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    return fail("fcntl");
  }

  started_ = true;
  running_.store(true, std::memory_order_release);
  if (logger_) {
    logger_->info(trace_id_, kComponent, "server_started",
                  "serving " + display_name_ + " on port " +
                      std::to_string(port_));
  }
  worker_.spawn([this, fd]() { serve(fd); });
  return R::Ok();
}

void TransferService::stop() {
  running_.store(false, std::memory_order_release);
  if (stop_->request_stop() && logger_) {
    logger_->info(trace_id_, kComponent, "stop_requested", display_name_);
  }
}

void TransferService::wait() { worker_.wait_all(); }

void TransferService::serve(int listen_fd) {
  const int timeout_ms = static_cast<int>(options_.poll_interval.count());
  std::size_t served = 0;

  while (!stop_->is_stop_requested()) {
    pollfd pfd{};
    pfd.fd = listen_fd;
    connections_.reap_finished();
    // At the cap, leave new clients in the backlog until a slot frees up.
    pfd.events = connections_.size() < options_.max_connections ? POLLIN : 0;
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (logger_) {
        logger_->error(trace_id_, kComponent, "poll_failed",
                       std::strerror(errno));
      }
      break;
    }
    if (rc == 0 || (pfd.revents & POLLIN) == 0 ||
        stop_->is_stop_requested()) {
      continue;
    }

    const int client =
        ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (client < 0) {
      if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK &&
          errno != ECONNABORTED && logger_) {
        logger_->warn(trace_id_, kComponent, "accept_failed",
                      std::strerror(errno));
      }
      continue;
    }
    if (stop_->is_stop_requested()) {
      // Accepted after stop(): close without answering.
      ::close(client);
      break;
    }

    connections_.spawn([this, client]() {
      endpoint_.handle_connection(client, *stop_);
      ::close(client);
    });
    ++served;
  }

  ::close(listen_fd);
  connections_.wait_all();
  running_.store(false, std::memory_order_release);
  if (logger_) {
    logger_->info(trace_id_, kComponent, "server_stopped",
                  "connections=" + std::to_string(served));
  }
}

} // namespace ngl::infra
