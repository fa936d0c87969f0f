#include "core/job_registry.h"

#include "core/conversion_engine.h"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace ngl::core {

JobRegistry::JobRegistry(std::size_t log_retention)
    : log_retention_(log_retention) {}

JobTicket JobRegistry::begin(const JobKey &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry entry;
  entry.generation = next_generation_++;
  entry.state.is_active = true;
  entry.state.progress = 0.0;
  entry.state.last_message = "Starting download...";
  const auto generation = entry.generation;
  jobs_[key] = std::move(entry);
  return JobTicket{key, generation};
}

bool JobRegistry::apply(const JobTicket &ticket, const JobEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(ticket.key);
  if (it == jobs_.end() || it->second.generation != ticket.generation ||
      it->second.completed) {
    return false;
  }
  Entry &entry = it->second;

  std::visit(
      [this, &entry](const auto &ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, ProgressUpdate>) {
          entry.state.progress = ev.percent;
        } else if constexpr (std::is_same_v<T, LogLine>) {
          append_log_locked(entry, ev.text);
        } else {
          entry.completed = true;
          entry.state.is_active = false;
          entry.state.progress.reset();
          if (ev.outcome.is_ok()) {
            entry.state.last_message = ev.outcome.value();
            entry.state.last_error_kind.reset();
          } else {
            entry.state.last_message = "Error: " + ev.outcome.error().message;
            entry.state.last_error_kind = ev.outcome.error().kind;
          }
        }
      },
      event);
  return true;
}

std::size_t JobRegistry::consume(const JobTicket &ticket, JobStream &stream) {
  std::size_t applied = 0;
  while (auto event = stream.next()) {
    if (apply(ticket, *event)) {
      ++applied;
    }
    if (is_terminal(*event)) {
      break;
    }
  }
  return applied;
}

std::optional<JobState> JobRegistry::snapshot(const JobKey &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(key);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

bool JobRegistry::contains(const JobKey &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.count(key) > 0;
}

std::vector<JobKey> JobRegistry::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobKey> out;
  out.reserve(jobs_.size());
  for (const auto &kv : jobs_) {
    out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t JobRegistry::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(jobs_.begin(), jobs_.end(),
                    [](const auto &kv) { return kv.second.state.is_active; }));
}

bool JobRegistry::discard(const JobKey &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.erase(key) > 0;
}

void JobRegistry::append_log_locked(Entry &entry, std::string line) {
  auto &log = entry.state.log;
  log.push_back(std::move(line));
  if (log_retention_ == 0) {
    return;
  }
  while (log.size() > log_retention_) {
    log.pop_front();
    ++entry.state.dropped_log_lines;
  }
}

} // namespace ngl::core
