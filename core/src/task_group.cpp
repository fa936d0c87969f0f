#include "core/task_group.h"

#include <utility>
#include <vector>

namespace ngl::core {

TaskGroup::~TaskGroup() { wait_all(); }

void TaskGroup::spawn(std::function<void()> fn) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread t([fn = std::move(fn), done]() {
    fn();
    done->store(true, std::memory_order_release);
  });

  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(Entry{std::move(t), std::move(done)});
}

std::size_t TaskGroup::reap_finished() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->done->load(std::memory_order_acquire)) {
        finished.push_back(std::move(it->thread));
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Join outside the lock; these threads are past their last statement.
  for (auto &t : finished) {
    if (t.joinable()) {
      t.join();
    }
  }
  return finished.size();
}

void TaskGroup::wait_all() {
  while (true) {
    std::list<Entry> batch;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (entries_.empty()) {
        return;
      }
      batch.swap(entries_);
    }
    for (auto &entry : batch) {
      if (entry.thread.joinable()) {
        entry.thread.join();
      }
    }
  }
}

std::size_t TaskGroup::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t TaskGroup::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t n = 0;
  for (const auto &entry : entries_) {
    if (!entry.done->load(std::memory_order_acquire)) {
      ++n;
    }
  }
  return n;
}

} // namespace ngl::core
