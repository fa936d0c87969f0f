#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace ngl::core {

/// One-shot, thread-safe stop flag.
///
/// Single writer (the controller calling request_stop()) / multi reader
/// (serve loops polling is_stop_requested()). The flag is an atomic<bool>
/// with acquire/release ordering; it moves false -> true at most once.
class StopSignal {
public:
  StopSignal() = default;

  /// Request a stop. Thread-safe, idempotent.
  /// Returns true only for the call that actually flipped the flag.
  bool request_stop() noexcept;

  [[nodiscard]] bool is_stop_requested() const noexcept;

  /// Register a callback invoked once when the stop is requested.
  /// Runs immediately if the stop has already been requested.
  using Callback = std::function<void()>;
  void on_stop(Callback cb);

  static std::shared_ptr<StopSignal> create();

private:
  std::atomic<bool> stopped_{false};
  std::mutex cb_mutex_;
  std::vector<Callback> callbacks_;
};

} // namespace ngl::core
