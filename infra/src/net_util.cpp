#include "infra/net_util.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ngl::infra {

using ngl::core::Error;
using ngl::core::Result;

namespace {

class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  [[nodiscard]] int get() const { return fd_; }

private:
  int fd_;
};

Error socket_error(const std::string &what) {
  const int err = errno;
  return Error::Network(what + ": " + std::strerror(err), err);
}

} // namespace

Result<std::uint16_t, Error> select_ephemeral_port() {
  using R = Result<std::uint16_t, Error>;
  ScopedFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (fd.get() < 0) {
    return R::Err(socket_error("Failed to create socket"));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = 0;
  if (::bind(fd.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) !=
      0) {
    return R::Err(socket_error("Failed to bind to random port"));
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd.get(), reinterpret_cast<sockaddr *>(&addr), &len) !=
      0) {
    return R::Err(socket_error("Failed to get local address"));
  }
  return R::Ok(ntohs(addr.sin_port));
}

Result<std::string, Error> discover_local_ip(const std::string &route_host,
                                             std::uint16_t route_port) {
  using R = Result<std::string, Error>;

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo *found = nullptr;
  const std::string service = std::to_string(route_port);
  const int gai = ::getaddrinfo(route_host.c_str(), service.c_str(), &hints,
                                &found);
  if (gai != 0 || found == nullptr) {
    return R::Err(Error::Network("Failed to resolve " + route_host + ": " +
                                 ::gai_strerror(gai)));
  }
  sockaddr_in target{};
  std::memcpy(&target, found->ai_addr, sizeof(target));
  ::freeaddrinfo(found);

  ScopedFd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (fd.get() < 0) {
    return R::Err(socket_error("Failed to create socket"));
  }
  if (::connect(fd.get(), reinterpret_cast<sockaddr *>(&target),
                sizeof(target)) != 0) {
    return R::Err(socket_error("Failed to connect"));
  }

  sockaddr_in local{};
  socklen_t len = sizeof(local);
  if (::getsockname(fd.get(), reinterpret_cast<sockaddr *>(&local), &len) !=
      0) {
    return R::Err(socket_error("Failed to get local address"));
  }

  char text[INET_ADDRSTRLEN] = {};
  if (::inet_ntop(AF_INET, &local.sin_addr, text, sizeof(text)) == nullptr) {
    return R::Err(socket_error("Failed to format local address"));
  }
  std::string ip(text);
  if (is_unusable_local_address(ip)) {
    return R::Err(Error::Network("No usable local network address (got " +
                                 ip + ")"));
  }
  return R::Ok(std::move(ip));
}

bool is_unusable_local_address(const std::string &ipv4) {
  return ipv4 == "0.0.0.0" || ipv4.rfind("127.", 0) == 0;
}

} // namespace ngl::infra
