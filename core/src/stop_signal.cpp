#include "core/stop_signal.h"

#include <exception>

namespace ngl::core {

bool StopSignal::request_stop() noexcept {
  bool expected = false;
  if (!stopped_.compare_exchange_strong(expected, true,
                                        std::memory_order_release,
                                        std::memory_order_relaxed)) {
    return false;
  }

  std::vector<Callback> pending;
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    pending.swap(callbacks_);
  }
  for (auto &cb : pending) {
    if (!cb) {
      continue;
    }
    try {
      cb();
    } catch (const std::exception &) {
      // A failing observer must not keep the flag from being published.
    }
  }
  return true;
}

bool StopSignal::is_stop_requested() const noexcept {
  return stopped_.load(std::memory_order_acquire);
}

void StopSignal::on_stop(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    if (!is_stop_requested()) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  if (cb) {
    cb();
  }
}

std::shared_ptr<StopSignal> StopSignal::create() {
  return std::make_shared<StopSignal>();
}

} // namespace ngl::core
