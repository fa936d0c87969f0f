#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace ngl::core {

/// Owns a set of background threads so their completion can be awaited.
///
/// Every spawned task is joined either by reap_finished(), wait_all() or
/// the destructor; nothing is ever detached.
class TaskGroup {
public:
  TaskGroup() = default;
  ~TaskGroup();

  TaskGroup(const TaskGroup &) = delete;
  TaskGroup &operator=(const TaskGroup &) = delete;

  void spawn(std::function<void()> fn);

  /// Join tasks that have already returned. Never blocks on a running one.
  /// Returns the number of tasks joined.
  std::size_t reap_finished();

  /// Block until every task spawned so far has returned.
  /// Must not be called from one of the group's own tasks.
  void wait_all();

  /// Number of tasks not yet joined (running or finished-but-unreaped).
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t running() const;

private:
  struct Entry {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  mutable std::mutex mutex_;
  std::list<Entry> entries_;
};

} // namespace ngl::core
