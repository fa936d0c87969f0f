#pragma once

#include "core/error.h"
#include "core/result.h"
#include "core/stop_signal.h"
#include "core/task_group.h"
#include "infra/transfer_endpoint.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ngl::core {
class ILogger;
}

namespace ngl::infra {

struct TransferOptions {
  std::string route_host = "8.8.8.8"; // routing target for get_url()
  std::uint16_t route_port = 80;
  std::chrono::milliseconds poll_interval{100};
  std::size_t max_connections = 16;
};

/// TransferService — ephemeral LAN HTTP server for one local file.
///
/// Lifecycle: create() -> start() -> stop(). A stopped service cannot be
/// restarted; create a new one. The serve loop runs on a worker owned by
/// the service and is joined by wait() or the destructor. Each accepted
/// connection is answered on its own task, so a slow client never holds up
/// another; the loop joins them all before it exits.
class TransferService {
public:
  /// Err(NotFound) when `file_path` is not an existing regular file,
  /// Err(Network) when no port can be reserved.
  static ngl::core::Result<std::unique_ptr<TransferService>, ngl::core::Error>
  create(const std::string &file_path,
         std::shared_ptr<ngl::core::ILogger> logger = nullptr,
         TransferOptions options = {});

  ~TransferService();

  TransferService(const TransferService &) = delete;
  TransferService &operator=(const TransferService &) = delete;

  [[nodiscard]] std::uint16_t port() const { return port_; }
  [[nodiscard]] const std::string &file_path() const { return file_path_; }
  [[nodiscard]] const std::string &display_name() const {
    return display_name_;
  }
  [[nodiscard]] bool is_running() const {
    return running_.load(std::memory_order_acquire);
  }

  /// `http://<lan-ip>:<port>`. Err(Network) without a usable interface.
  [[nodiscard]] ngl::core::Result<std::string, ngl::core::Error>
  get_url() const;

  /// The URL as a terminal-printable QR code.
  [[nodiscard]] ngl::core::Result<std::string, ngl::core::Error>
  generate_display_code() const;

  /// Bind 0.0.0.0:<port> and serve in the background. No-op while running.
  ngl::core::Result<void, ngl::core::Error> start();

  /// Ask the serve loop to exit. Idempotent; never fails or blocks.
  void stop();

  /// Block until the serve loop has exited.
  void wait();

private:
  TransferService(std::string file_path, std::string display_name,
                  std::uint16_t port, std::shared_ptr<ngl::core::ILogger> logger,
                  TransferOptions options);

  void serve(int listen_fd);

  const std::string file_path_;
  const std::string display_name_;
  const std::uint16_t port_;
  const std::string trace_id_;
  std::shared_ptr<ngl::core::ILogger> logger_;
  TransferOptions options_;
  TransferEndpoint endpoint_;

  std::mutex lifecycle_mutex_;
  bool started_ = false;
  std::atomic<bool> running_{false};
  std::shared_ptr<ngl::core::StopSignal> stop_;
  ngl::core::TaskGroup connections_;
  ngl::core::TaskGroup worker_;
};

} // namespace ngl::infra
