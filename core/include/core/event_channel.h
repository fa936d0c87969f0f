#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace ngl::core {

/// Unbounded multi-producer / single-consumer channel.
///
/// Senders are copyable; the channel closes when the last Sender is
/// destroyed. The Receiver drains every value sent before close, in send
/// order per producer, then reports end-of-stream with std::nullopt.
template <typename T> class EventChannel {
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<T> queue;
    std::size_t senders = 0;
  };

public:
  class Sender {
  public:
    Sender() = default;

    Sender(const Sender &other) : state_(other.state_) { attach(); }

    Sender &operator=(const Sender &other) {
      if (this != &other) {
        detach();
        state_ = other.state_;
        attach();
      }
      return *this;
    }

    Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}

    Sender &operator=(Sender &&other) noexcept {
      if (this != &other) {
        detach();
        state_ = std::move(other.state_);
      }
      return *this;
    }

    ~Sender() { detach(); }

    /// Returns false if this sender was already closed.
    bool send(T value) {
      if (!state_) {
        return false;
      }
      {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->queue.push_back(std::move(value));
      }
      state_->cv.notify_one();
      return true;
    }

    /// Drop this producer early; the channel closes with the last one.
    void close() { detach(); }

  private:
    friend class EventChannel;
    explicit Sender(std::shared_ptr<State> state) : state_(std::move(state)) {
      attach();
    }

    void attach() {
      if (!state_) {
        return;
      }
      std::lock_guard<std::mutex> lock(state_->mutex);
      ++state_->senders;
    }

    void detach() {
      if (!state_) {
        return;
      }
      bool closed = false;
      {
        std::lock_guard<std::mutex> lock(state_->mutex);
        closed = --state_->senders == 0;
      }
      if (closed) {
        state_->cv.notify_all();
      }
      state_.reset();
    }

    std::shared_ptr<State> state_;
  };

  class Receiver {
  public:
    Receiver() = default;

    /// Block until a value arrives or the channel is closed and drained.
    std::optional<T> recv() {
      if (!state_) {
        return std::nullopt;
      }
      std::unique_lock<std::mutex> lock(state_->mutex);
      state_->cv.wait(lock, [this] {
        return !state_->queue.empty() || state_->senders == 0;
      });
      return pop_locked();
    }

    /// Never blocks.
    std::optional<T> try_recv() {
      if (!state_) {
        return std::nullopt;
      }
      std::lock_guard<std::mutex> lock(state_->mutex);
      return pop_locked();
    }

    template <typename Rep, typename Period>
    std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
      if (!state_) {
        return std::nullopt;
      }
      std::unique_lock<std::mutex> lock(state_->mutex);
      state_->cv.wait_for(lock, timeout, [this] {
        return !state_->queue.empty() || state_->senders == 0;
      });
      return pop_locked();
    }

    /// True once every sender is gone and nothing is left to read.
    [[nodiscard]] bool is_drained() const {
      if (!state_) {
        return true;
      }
      std::lock_guard<std::mutex> lock(state_->mutex);
      return state_->senders == 0 && state_->queue.empty();
    }

  private:
    friend class EventChannel;
    explicit Receiver(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::optional<T> pop_locked() {
      if (state_->queue.empty()) {
        return std::nullopt;
      }
      std::optional<T> value(std::move(state_->queue.front()));
      state_->queue.pop_front();
      return value;
    }

    std::shared_ptr<State> state_;
  };

  static std::pair<Sender, Receiver> create() {
    auto state = std::make_shared<State>();
    return {Sender(state), Receiver(state)};
  }
};

} // namespace ngl::core
