#pragma once

#include "core/error.h"
#include "core/result.h"

#include <cstdint>
#include <string>

namespace ngl::infra {

/// Bind a throwaway TCP socket to 0.0.0.0:0 and return the port the kernel
/// picked. The socket is closed before returning, so another process may
/// take the port before it is bound again.
ngl::core::Result<std::uint16_t, ngl::core::Error> select_ephemeral_port();

/// IPv4 address of the interface that routes to `route_host:route_port`.
/// Connects a UDP socket (no packet is sent) and reads its local endpoint.
/// Loopback and unspecified results are rejected with Network.
ngl::core::Result<std::string, ngl::core::Error>
discover_local_ip(const std::string &route_host = "8.8.8.8",
                  std::uint16_t route_port = 80);

/// True for 127.0.0.0/8 and 0.0.0.0.
bool is_unusable_local_address(const std::string &ipv4);

} // namespace ngl::infra
