#pragma once

#include "core/error.h"
#include "core/result.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace ngl::core {
class ILogger;
class StopSignal;
} // namespace ngl::core

namespace ngl::infra {

/// Request line of an HTTP/1.x request. `path` is `target` without query.
struct RequestHead {
  std::string method;
  std::string target;
  std::string path;
};

enum class TransferRoute { Index, Download, NotFound };

/// Parse the request line out of a raw header block. Err(Parse) when it is
/// not `METHOD SP TARGET SP VERSION`.
ngl::core::Result<RequestHead, ngl::core::Error>
parse_request_head(const std::string &raw);

/// "/" and "/download"; everything else is NotFound.
TransferRoute route_for(const std::string &path);

/// GET and HEAD; anything else is answered with 405.
bool is_allowed_method(const std::string &method);

std::string html_escape(const std::string &text);

/// Landing page naming the shared file and linking to /download.
std::string render_index_page(const std::string &display_name);

/// `attachment; filename="<name>"` with quotes, backslashes and control
/// characters neutralised.
std::string content_disposition(const std::string &display_name);

/// Answers one connection of the transfer server: reads the request head,
/// routes it and writes a single `Connection: close` response.
///
/// The socket must be non-blocking. The whole request head has to arrive
/// within kHeadDeadline; a stop request abandons a connection still waiting
/// for its head. A response already being written is never cut short by a
/// stop, only when the peer accepts no bytes for kSendStallLimit.
class TransferEndpoint {
public:
  static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
  static constexpr std::size_t kChunkSize = 64 * 1024;
  static constexpr std::chrono::milliseconds kHeadDeadline{5000};
  static constexpr std::chrono::milliseconds kSendStallLimit{5000};
  static constexpr std::chrono::milliseconds kLingerLimit{1000};

  TransferEndpoint(std::string file_path, std::string display_name,
                   std::shared_ptr<ngl::core::ILogger> logger,
                   std::string trace_id);

  /// Serve one request on a connected socket. The caller closes `fd`.
  /// `stop` is consulted only while the request head is being read.
  void handle_connection(int fd, const ngl::core::StopSignal &stop) const;

  [[nodiscard]] const std::string &file_path() const { return file_path_; }

private:
  ngl::core::Result<std::string, ngl::core::Error>
  read_head(int fd, const ngl::core::StopSignal &stop) const;
  void serve_index(int fd, bool head_only) const;
  void serve_download(int fd, bool head_only) const;
  void serve_text(int fd, int status, const std::string &body,
                  bool head_only = false,
                  const std::string &extra_headers = {}) const;
  void log_warn(const std::string &event, const std::string &msg) const;

  std::string file_path_;
  std::string display_name_;
  std::shared_ptr<ngl::core::ILogger> logger_;
  std::string trace_id_;
};

} // namespace ngl::infra
