#include "infra/transfer_endpoint.h"

#include "core/logger.h"
#include "core/stop_signal.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace ngl::infra {

using ngl::core::Error;
using ngl::core::ErrorKind;
using ngl::core::Result;

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char *kComponent = "transfer_endpoint";
constexpr int kStopCheckMs = 100;

const char *reason_phrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 431:
    return "Request Header Fields Too Large";
  default:
    return "Status";
  }
}

enum class Readiness { Ready, TimedOut, Stopped, Failed };

// Poll `fd` for `events` until `deadline`. With a stop signal, wakes every
// kStopCheckMs to notice a stop request.
Readiness wait_until(int fd, short events, Clock::time_point deadline,
                     const ngl::core::StopSignal *stop = nullptr) {
  while (true) {
    if (stop != nullptr && stop->is_stop_requested()) {
      return Readiness::Stopped;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (left.count() <= 0) {
      return Readiness::TimedOut;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    const int rc = ::poll(
        &pfd, 1, static_cast<int>(std::min<long long>(left.count(), kStopCheckMs)));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Readiness::Failed;
    }
    if (rc > 0) {
      // POLLHUP/POLLERR count as ready: the next recv or send reports them.
      return Readiness::Ready;
    }
  }
}

// Sends everything, giving up after kSendStallLimit without progress.
bool send_all(int fd, const char *data, std::size_t len) {
  std::size_t sent = 0;
  auto deadline = Clock::now() + TransferEndpoint::kSendStallLimit;
  while (sent < len) {
    const ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<std::size_t>(n);
      deadline = Clock::now() + TransferEndpoint::kSendStallLimit;
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (wait_until(fd, POLLOUT, deadline) != Readiness::Ready) {
        return false;
      }
      continue;
    }
    return false;
  }
  return true;
}

bool send_all(int fd, const std::string &data) {
  return send_all(fd, data.data(), data.size());
}

// Half-close and read off what the client is still sending, so closing
// with unread input does not reset the connection before the response lands.
void linger_close(int fd) {
  ::shutdown(fd, SHUT_WR);
  const auto deadline = Clock::now() + TransferEndpoint::kLingerLimit;
  char sink[4096];
  std::size_t drained = 0;
  while (drained < TransferEndpoint::kMaxHeaderBytes * 4) {
    const ssize_t n = ::recv(fd, sink, sizeof(sink), 0);
    if (n > 0) {
      drained += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) &&
        wait_until(fd, POLLIN, deadline) == Readiness::Ready) {
      continue;
    }
    break;
  }
}

std::string response_head(int status, const std::string &content_type,
                          std::size_t content_length,
                          const std::string &extra_headers = {}) {
  std::ostringstream head;
  head << "HTTP/1.1 " << status << ' ' << reason_phrase(status) << "\r\n";
  head << "Content-Type: " << content_type << "\r\n";
  head << "Content-Length: " << content_length << "\r\n";
  head << extra_headers;
  head << "Connection: close\r\n\r\n";
  return head.str();
}

} // namespace

Result<RequestHead, Error> parse_request_head(const std::string &raw) {
  const auto eol = raw.find("\r\n");
  const std::string line = raw.substr(0, eol);

  RequestHead head;
  std::string version;
  std::istringstream stream(line);
  stream >> head.method >> head.target >> version;
  if (head.method.empty() || head.target.empty() ||
      version.rfind("HTTP/", 0) != 0) {
    return Result<RequestHead, Error>::Err(
        Error(ErrorKind::Parse, 0, "Malformed request line: " + line));
  }
  head.path = head.target.substr(0, head.target.find_first_of("?#"));
  return Result<RequestHead, Error>::Ok(std::move(head));
}

TransferRoute route_for(const std::string &path) {
  if (path == "/") {
    return TransferRoute::Index;
  }
  if (path == "/download") {
    return TransferRoute::Download;
  }
  return TransferRoute::NotFound;
}

bool is_allowed_method(const std::string &method) {
  return method == "GET" || method == "HEAD";
}

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string render_index_page(const std::string &display_name) {
  const std::string name = html_escape(display_name);
  std::ostringstream html;
  html << R"(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Download )"
       << name << R"(</title>
<style>
body { font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, sans-serif;
       max-width: 600px; margin: 50px auto; padding: 20px; text-align: center;
       background: #1a1a1a; color: #ffffff; }
h1 { color: #4a9eff; margin-bottom: 30px; }
.filename { background: #2a2a2a; padding: 15px; border-radius: 8px; margin: 20px 0;
            word-break: break-all; font-family: monospace; }
.download-btn { display: inline-block; padding: 15px 40px; background: #4a9eff;
                color: white; text-decoration: none; border-radius: 8px; font-size: 18px; }
.download-btn:hover { background: #3a7edf; }
.info { color: #888; margin-top: 30px; font-size: 14px; }
</style>
</head>
<body>
<h1>Nightingale File Transfer</h1>
<div class="filename">)"
       << name << R"(</div>
<a href="/download" class="download-btn">Download MP3</a>
<p class="info">The file is saved to your device's Downloads folder.</p>
<p class="info">It is not added to the Music app; open it with a file manager or media player.</p>
</body>
</html>
)";
  return html.str();
}

std::string content_disposition(const std::string &display_name) {
  std::string safe;
  safe.reserve(display_name.size());
  for (char c : display_name) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\' || uc < 0x20 || uc == 0x7f) {
      safe += '_';
    } else {
      safe += c;
    }
  }
  return "attachment; filename=\"" + safe + "\"";
}

TransferEndpoint::TransferEndpoint(std::string file_path,
                                   std::string display_name,
                                   std::shared_ptr<ngl::core::ILogger> logger,
                                   std::string trace_id)
    : file_path_(std::move(file_path)), display_name_(std::move(display_name)),
      logger_(std::move(logger)), trace_id_(std::move(trace_id)) {}

void TransferEndpoint::handle_connection(
    int fd, const ngl::core::StopSignal &stop) const {
  auto raw = read_head(fd, stop);
  if (raw.is_err()) {
    const Error &err = raw.error();
    log_warn("request_read_failed", err.message);
    if (err.kind == ErrorKind::Parse) {
      serve_text(fd, 431, "Request headers too large");
      linger_close(fd);
    } else if (err.code == ETIMEDOUT) {
      serve_text(fd, 408, "Request timeout");
      linger_close(fd);
    }
    return;
  }

  auto head = parse_request_head(raw.value());
  if (head.is_err()) {
    log_warn("bad_request", head.error().message);
    serve_text(fd, 400, "Bad request");
    linger_close(fd);
    return;
  }

  const RequestHead &req = head.value();
  if (logger_) {
    logger_->debug(trace_id_, kComponent, "request",
                   req.method + " " + req.target);
  }
  if (!is_allowed_method(req.method)) {
    log_warn("method_not_allowed", req.method + " " + req.target);
    serve_text(fd, 405, "Method not allowed", false,
               "Allow: GET, HEAD\r\n");
    linger_close(fd);
    return;
  }
  const bool head_only = req.method == "HEAD";

  switch (route_for(req.path)) {
  case TransferRoute::Index:
    serve_index(fd, head_only);
    break;
  case TransferRoute::Download:
    serve_download(fd, head_only);
    break;
  case TransferRoute::NotFound:
    serve_text(fd, 404, "Not found", head_only);
    break;
  }
}

Result<std::string, Error>
TransferEndpoint::read_head(int fd, const ngl::core::StopSignal &stop) const {
  using R = Result<std::string, Error>;
  const auto deadline = Clock::now() + kHeadDeadline;
  std::string raw;
  char buffer[4096];
  while (raw.find("\r\n\r\n") == std::string::npos) {
    if (raw.size() > kMaxHeaderBytes) {
      return R::Err(Error(ErrorKind::Parse, 0,
                          "Request head exceeds " +
                              std::to_string(kMaxHeaderBytes) + " bytes"));
    }
    const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
    if (n > 0) {
      raw.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      return R::Err(Error::Io("Connection closed before request head"));
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      const int err = errno;
      return R::Err(
          Error::Io(std::string("recv failed: ") + std::strerror(err), err));
    }
    switch (wait_until(fd, POLLIN, deadline, &stop)) {
    case Readiness::Ready:
      break;
    case Readiness::TimedOut:
      return R::Err(Error::Io("Request head not complete within " +
                                  std::to_string(kHeadDeadline.count()) +
                                  " ms",
                              ETIMEDOUT));
    case Readiness::Stopped:
      return R::Err(Error::Io("Server stopping"));
    case Readiness::Failed: {
      const int err = errno;
      return R::Err(
          Error::Io(std::string("poll failed: ") + std::strerror(err), err));
    }
    }
  }
  return R::Ok(std::move(raw));
}

void TransferEndpoint::serve_index(int fd, bool head_only) const {
  const std::string body = render_index_page(display_name_);
  std::string response =
      response_head(200, "text/html; charset=utf-8", body.size());
  if (!head_only) {
    response += body;
  }
  if (!send_all(fd, response)) {
    log_warn("send_failed", "index page");
  }
}

void TransferEndpoint::serve_download(int fd, bool head_only) const {
  // Opened per request: a file removed after start() turns into a 404.
  std::ifstream file(file_path_, std::ios::binary | std::ios::ate);
  if (!file) {
    serve_text(fd, 404, "File not found", head_only);
    return;
  }
  const std::streamoff size = file.tellg();
  if (size < 0) {
    serve_text(fd, 404, "File not found", head_only);
    return;
  }
  file.seekg(0, std::ios::beg);

  const std::string head = response_head(
      200, "audio/mpeg", static_cast<std::size_t>(size),
      "Content-Disposition: " + content_disposition(display_name_) + "\r\n");
  if (!send_all(fd, head)) {
    log_warn("send_failed", "download head");
    return;
  }
  if (head_only) {
    return;
  }

  std::vector<char> chunk(kChunkSize);
  std::streamoff remaining = size;
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(
        std::min<std::streamoff>(remaining, static_cast<std::streamoff>(chunk.size())));
    file.read(chunk.data(), want);
    const std::streamsize got = file.gcount();
    if (got <= 0) {
      log_warn("short_read", file_path_);
      return;
    }
    if (!send_all(fd, chunk.data(), static_cast<std::size_t>(got))) {
      log_warn("send_failed", "download abandoned after " +
                                  std::to_string(size - remaining) + " bytes");
      return;
    }
    remaining -= got;
  }

  if (logger_) {
    logger_->info(trace_id_, kComponent, "download_served",
                  display_name_ + " bytes=" + std::to_string(size));
  }
}

void TransferEndpoint::serve_text(int fd, int status, const std::string &body,
                                  bool head_only,
                                  const std::string &extra_headers) const {
  std::string response = response_head(status, "text/plain; charset=utf-8",
                                       body.size(), extra_headers);
  if (!head_only) {
    response += body;
  }
  if (!send_all(fd, response)) {
    log_warn("send_failed", "status " + std::to_string(status));
  }
}

void TransferEndpoint::log_warn(const std::string &event,
                                const std::string &msg) const {
  if (logger_) {
    logger_->warn(trace_id_, kComponent, event, msg);
  }
}

} // namespace ngl::infra
